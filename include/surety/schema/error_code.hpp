#pragma once

#include <surety/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace surety::schema {

enum class error_code : uint32_t {
  ok = 0,
  not_operational = 1,
  unauthorized = 2,
  not_authorized_airline = 3,
  already_registered = 4,
  already_funded = 5,
  insufficient_payment = 6,
  duplicate_claim = 7,
  unknown_flight = 8,
  flight_already_exists = 9,
  index_mismatch = 10,
  no_matching_request = 11,
  insufficient_credit = 12,
  pool_underfunded = 13,
  invalid_amount = 20,
  invalid_buyer = 21,
  flight_status_finalized = 22,
  transfer_failed = 23,
};

inline constexpr auto kErrorCodeMappings = std::array{
    enum_mapping_t<error_code>{"ok", error_code::ok},
    enum_mapping_t<error_code>{"not_operational", error_code::not_operational},
    enum_mapping_t<error_code>{"unauthorized", error_code::unauthorized},
    enum_mapping_t<error_code>{"not_authorized_airline",
                               error_code::not_authorized_airline},
    enum_mapping_t<error_code>{"already_registered",
                               error_code::already_registered},
    enum_mapping_t<error_code>{"already_funded", error_code::already_funded},
    enum_mapping_t<error_code>{"insufficient_payment",
                               error_code::insufficient_payment},
    enum_mapping_t<error_code>{"duplicate_claim", error_code::duplicate_claim},
    enum_mapping_t<error_code>{"unknown_flight", error_code::unknown_flight},
    enum_mapping_t<error_code>{"flight_already_exists",
                               error_code::flight_already_exists},
    enum_mapping_t<error_code>{"index_mismatch", error_code::index_mismatch},
    enum_mapping_t<error_code>{"no_matching_request",
                               error_code::no_matching_request},
    enum_mapping_t<error_code>{"insufficient_credit",
                               error_code::insufficient_credit},
    enum_mapping_t<error_code>{"pool_underfunded",
                               error_code::pool_underfunded},
    enum_mapping_t<error_code>{"invalid_amount", error_code::invalid_amount},
    enum_mapping_t<error_code>{"invalid_buyer", error_code::invalid_buyer},
    enum_mapping_t<error_code>{"flight_status_finalized",
                               error_code::flight_status_finalized},
    enum_mapping_t<error_code>{"transfer_failed", error_code::transfer_failed}};

inline constexpr std::string_view to_string(const error_code value) {
  return enum_name(value, kErrorCodeMappings);
}

}  // namespace surety::schema
