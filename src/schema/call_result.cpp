#include <surety/schema/call_result.hpp>

namespace surety::schema {

call_result_t make_error_result(const error_code code,
                                const std::string_view codespace,
                                const std::string_view info) {
  auto result = call_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::string{info};
  result.codespace = std::string{codespace};
  return result;
}

call_event_t make_event(
    const std::string_view type,
    std::vector<std::pair<std::string, std::string>> attributes) {
  auto event = call_event_t{};
  event.type = std::string{type};
  event.attributes.reserve(attributes.size());
  for (auto& [key, value] : attributes) {
    event.attributes.push_back(call_event_attribute_t{
        .key = std::move(key), .value = std::move(value), .index = true});
  }
  return event;
}

}  // namespace surety::schema
