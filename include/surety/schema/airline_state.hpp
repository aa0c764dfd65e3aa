#pragma once

#include <surety/schema/airline_status.hpp>
#include <surety/schema/primitives.hpp>
#include <vector>

// Schema type: airline state.
// Admission record for one airline identity, including the targets it has
// voted for.
namespace surety::schema {

template <uint16_t Version>
struct airline_state;

template <>
struct airline_state<1> final {
  uint16_t version{1};
  account_id_t airline;
  airline_status_t status{airline_status_t::unknown};
  bool has_paid_fund{};
  std::vector<account_id_t> votes_cast;
};

using airline_state_t = airline_state<1>;

}  // namespace surety::schema
