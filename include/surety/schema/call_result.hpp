#pragma once

#include <surety/schema/call_event.hpp>
#include <surety/schema/error_code.hpp>
#include <surety/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace surety::schema {

template <uint16_t Version>
struct call_result;

template <>
struct call_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<call_event_t> events;

  bool ok() const { return code == 0; }
  std::optional<error_code> error() const {
    if (code == 0) {
      return std::nullopt;
    }
    return static_cast<error_code>(code);
  }
};

using call_result_t = call_result<1>;

call_result_t make_error_result(error_code code,
                                std::string_view codespace,
                                std::string_view info = {});

call_event_t make_event(
    std::string_view type,
    std::vector<std::pair<std::string, std::string>> attributes);

}  // namespace surety::schema
