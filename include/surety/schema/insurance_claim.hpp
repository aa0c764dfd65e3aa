#pragma once

#include <surety/schema/primitives.hpp>

// Schema type: insurance claim.
// One per (flight, passenger); never overwritten.
namespace surety::schema {

template <uint16_t Version>
struct insurance_claim;

template <>
struct insurance_claim<1> final {
  uint16_t version{1};
  flight_key_t flight_key;
  account_id_t passenger;
  amount_t premium_paid{};
  bool payout_issued{};
};

using insurance_claim_t = insurance_claim<1>;

}  // namespace surety::schema
