#pragma once

#include <surety/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Flight status codes as reported by oracles. Numeric values are part of the
// oracle report interface and must not change.
namespace surety::schema {

enum class flight_status_t : uint8_t {
  unknown = 0,
  on_time = 10,
  late_airline = 20,
  late_weather = 30,
  late_technical = 40,
  late_other = 50
};

inline constexpr auto kFlightStatusMappings = std::array{
    enum_mapping_t<flight_status_t>{"unknown", flight_status_t::unknown},
    enum_mapping_t<flight_status_t>{"on_time", flight_status_t::on_time},
    enum_mapping_t<flight_status_t>{"late_airline",
                                    flight_status_t::late_airline},
    enum_mapping_t<flight_status_t>{"late_weather",
                                    flight_status_t::late_weather},
    enum_mapping_t<flight_status_t>{"late_technical",
                                    flight_status_t::late_technical},
    enum_mapping_t<flight_status_t>{"late_other", flight_status_t::late_other}};

inline std::optional<flight_status_t> try_flight_status_from_string(
    const std::string_view value) {
  return enum_from_string(value, kFlightStatusMappings);
}

inline std::optional<flight_status_t> try_flight_status_from_code(
    const uint8_t code) {
  for (const auto& mapping : kFlightStatusMappings) {
    if (static_cast<uint8_t>(mapping.second) == code) {
      return mapping.second;
    }
  }
  return std::nullopt;
}

inline constexpr std::string_view to_string(const flight_status_t value) {
  return enum_name(value, kFlightStatusMappings);
}

inline constexpr bool is_delayed(const flight_status_t value) {
  return value == flight_status_t::late_airline ||
         value == flight_status_t::late_weather ||
         value == flight_status_t::late_technical ||
         value == flight_status_t::late_other;
}

}  // namespace surety::schema
