#pragma once

#include <surety/schema/flight_status.hpp>
#include <surety/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: response request.
// An open status request addressed to oracles holding `index`, with the
// reports collected so far.
namespace surety::schema {

template <uint16_t Version>
struct oracle_report;

template <>
struct oracle_report<1> final {
  uint16_t version{1};
  account_id_t oracle;
  flight_status_t status{flight_status_t::unknown};
};

using oracle_report_t = oracle_report<1>;

template <uint16_t Version>
struct response_request;

template <>
struct response_request<1> final {
  uint16_t version{1};
  uint8_t index{};
  account_id_t airline;
  std::string flight;
  timestamp_seconds_t timestamp{};
  account_id_t requester;
  bool is_open{};
  std::vector<oracle_report_t> reports;
};

using response_request_t = response_request<1>;

}  // namespace surety::schema
