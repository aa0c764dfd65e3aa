#pragma once

#include <surety/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Admission lifecycle: unknown -> pending -> registered. Registered is
// terminal.
namespace surety::schema {

enum class airline_status_t : uint8_t {
  unknown = 0,
  pending = 1,
  registered = 2
};

inline constexpr auto kAirlineStatusMappings = std::array{
    enum_mapping_t<airline_status_t>{"unknown", airline_status_t::unknown},
    enum_mapping_t<airline_status_t>{"pending", airline_status_t::pending},
    enum_mapping_t<airline_status_t>{"registered",
                                     airline_status_t::registered}};

inline constexpr std::string_view to_string(const airline_status_t value) {
  return enum_name(value, kAirlineStatusMappings);
}

}  // namespace surety::schema
