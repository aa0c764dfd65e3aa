#pragma once

#include <surety/schema/flight_status.hpp>
#include <surety/schema/primitives.hpp>
#include <string>

// Schema type: flight state.
namespace surety::schema {

template <uint16_t Version>
struct flight_state;

template <>
struct flight_state<1> final {
  uint16_t version{1};
  flight_key_t key;
  account_id_t airline;
  std::string code;
  timestamp_seconds_t timestamp{};
  flight_status_t status{flight_status_t::unknown};
  bool oracle_resolved{};
};

using flight_state_t = flight_state<1>;

}  // namespace surety::schema
