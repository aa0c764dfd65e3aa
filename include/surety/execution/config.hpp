#pragma once

#include <surety/schema/primitives.hpp>
#include <cstdint>

namespace surety::execution {

/// Protocol constants and bootstrap identities for one registry instance.
struct engine_config final {
  surety::schema::account_id_t owner{};
  surety::schema::account_id_t first_airline{};
  // Below this many registered airlines admission needs no votes.
  uint32_t consensus_threshold{4};
  // Admission needs votes >= registered_count / multi_party_rate.
  uint32_t multi_party_rate{2};
  surety::schema::amount_t join_fee{10 * surety::schema::kEther};
  surety::schema::amount_t max_insurance_amount{1 * surety::schema::kEther};
  surety::schema::amount_t oracle_registration_fee{1 * surety::schema::kEther};
  uint32_t min_responses{3};
  uint8_t index_range{10};
};

}  // namespace surety::execution
