#pragma once

#include <surety/schema/primitives.hpp>

// Schema type: ledger state.
// Aggregate escrow balances. Conservation:
//   airline_escrow + insurance_pool + oracle_fees + credit_total
//     == total_received - total_paid_out
namespace surety::schema {

template <uint16_t Version>
struct ledger_state;

template <>
struct ledger_state<1> final {
  uint16_t version{1};
  amount_t airline_escrow{};
  amount_t insurance_pool{};
  amount_t oracle_fees{};
  amount_t credit_total{};
  amount_t total_received{};
  amount_t total_paid_out{};
};

using ledger_state_t = ledger_state<1>;

}  // namespace surety::schema
