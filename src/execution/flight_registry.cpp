#include <spdlog/spdlog.h>
#include <surety/execution/flight_registry.hpp>
#include <surety/schema/key/registry_keys.hpp>

using namespace surety::schema;

namespace surety::execution {

namespace {

constexpr auto kCodespace = std::string_view{"surety.flight"};

}  // namespace

flight_registry::flight_registry(encoder_t& encoder,
                                 storage_t& storage,
                                 const airline_registry& airlines)
    : encoder_{encoder}, storage_{storage}, airlines_{airlines} {}

flight_key_t flight_registry::key_of(const account_id_t& airline,
                                     const std::string& code,
                                     const timestamp_seconds_t timestamp) const {
  return key::make_flight_key(encoder_, airline, code, timestamp);
}

std::optional<flight_state_t> flight_registry::find(
    const flight_key_t& key) const {
  return storage_.get<flight_state_t>(encoder_,
                                      key::make_flight_state_key(encoder_, key));
}

void flight_registry::save(const flight_state_t& flight) {
  storage_.put(encoder_, key::make_flight_state_key(encoder_, flight.key),
               flight);
}

call_result_t flight_registry::register_flight(
    const account_id_t& airline,
    const std::string& code,
    const timestamp_seconds_t timestamp) {
  if (!airlines_.is_active(airline)) {
    return make_error_result(error_code::not_authorized_airline, kCodespace,
                             "airline must be registered and funded");
  }
  auto key = key_of(airline, code, timestamp);
  if (find(key)) {
    return make_error_result(error_code::flight_already_exists, kCodespace);
  }

  auto flight = flight_state_t{};
  flight.key = key;
  flight.airline = airline;
  flight.code = code;
  flight.timestamp = timestamp;
  save(flight);
  spdlog::info("Registered flight {} at {} for airline {}", code, timestamp,
               to_hex(airline));

  auto result = call_result_t{};
  result.data = encoder_.encode(key);
  result.events.push_back(
      make_event("flight_registered", {{"airline", to_hex(airline)},
                                       {"flight", code},
                                       {"timestamp", std::to_string(timestamp)},
                                       {"key", to_hex(key)}}));
  return result;
}

call_result_t flight_registry::set_status(const account_id_t& airline,
                                          const std::string& code,
                                          const timestamp_seconds_t timestamp,
                                          const flight_status_t status) {
  // The key embeds the airline, so only the owner can address its flight.
  auto flight = find(key_of(airline, code, timestamp));
  if (!flight) {
    return make_error_result(error_code::unknown_flight, kCodespace);
  }
  if (flight->oracle_resolved) {
    return make_error_result(error_code::flight_status_finalized, kCodespace,
                             "status already resolved by oracles");
  }

  flight->status = status;
  save(*flight);
  spdlog::info("Airline {} set flight {} status to {}", to_hex(airline), code,
               to_string(status));

  auto result = call_result_t{};
  result.events.push_back(make_event(
      "flight_status_resolved", {{"key", to_hex(flight->key)},
                                 {"flight", code},
                                 {"status", std::string{to_string(status)}},
                                 {"source", "airline"}}));
  return result;
}

call_result_t flight_registry::apply_resolution(const flight_key_t& key,
                                                const flight_status_t status) {
  auto flight = find(key);
  if (!flight) {
    return make_error_result(error_code::unknown_flight, kCodespace);
  }

  flight->status = status;
  flight->oracle_resolved = true;
  save(*flight);
  spdlog::info("Oracles resolved flight {} to {}", flight->code,
               to_string(status));

  auto result = call_result_t{};
  result.events.push_back(make_event(
      "flight_status_resolved", {{"key", to_hex(key)},
                                 {"flight", flight->code},
                                 {"status", std::string{to_string(status)}},
                                 {"source", "oracle"}}));
  return result;
}

}  // namespace surety::execution
