#include <spdlog/spdlog.h>
#include <surety/execution/fund_ledger.hpp>
#include <surety/schema/key/registry_keys.hpp>
#include <algorithm>

using namespace surety::schema;

namespace surety::execution {

fund_ledger::fund_ledger(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

ledger_state_t fund_ledger::totals() const {
  return storage_
      .get<ledger_state_t>(encoder_,
                           key::make_singleton_key(encoder_, key::kLedgerKey))
      .value_or(ledger_state_t{});
}

amount_t fund_ledger::credit_of(const account_id_t& passenger) const {
  return storage_.get<amount_t>(encoder_, key::make_credit_key(encoder_, passenger))
      .value_or(0);
}

void fund_ledger::save(const ledger_state_t& totals) {
  storage_.put(encoder_, key::make_singleton_key(encoder_, key::kLedgerKey),
               totals);
}

void fund_ledger::save_credit(const account_id_t& passenger,
                              const amount_t amount) {
  storage_.put(encoder_, key::make_credit_key(encoder_, passenger), amount);
}

void fund_ledger::deposit_escrow(const amount_t amount) {
  auto state = totals();
  state.airline_escrow += amount;
  state.total_received += amount;
  save(state);
}

void fund_ledger::deposit_pool(const amount_t amount) {
  auto state = totals();
  state.insurance_pool += amount;
  state.total_received += amount;
  save(state);
}

void fund_ledger::deposit_oracle_fee(const amount_t amount) {
  auto state = totals();
  state.oracle_fees += amount;
  state.total_received += amount;
  save(state);
}

std::optional<error_code> fund_ledger::credit_payout(
    const account_id_t& passenger,
    const amount_t amount) {
  auto state = totals();
  if (state.insurance_pool + state.airline_escrow < amount) {
    spdlog::warn(
        "Pool holds {} gwei and escrow {} gwei, cannot credit {} gwei to {}",
        state.insurance_pool, state.airline_escrow, amount, to_hex(passenger));
    return error_code::pool_underfunded;
  }
  auto from_pool = std::min(state.insurance_pool, amount);
  auto from_escrow = amount - from_pool;
  if (from_escrow > 0) {
    spdlog::info("Pool short by {} gwei; drawing it from airline escrow",
                 from_escrow);
  }
  state.insurance_pool -= from_pool;
  state.airline_escrow -= from_escrow;
  state.credit_total += amount;
  save(state);
  save_credit(passenger, credit_of(passenger) + amount);
  return std::nullopt;
}

std::optional<error_code> fund_ledger::withdraw(const account_id_t& passenger,
                                                const amount_t amount,
                                                const transfer_sink_t& sink) {
  auto balance = credit_of(passenger);
  if (amount > balance) {
    return error_code::insufficient_credit;
  }

  // Settle before the transfer; the recipient may re-enter.
  auto state = totals();
  state.credit_total -= amount;
  state.total_paid_out += amount;
  save(state);
  save_credit(passenger, balance - amount);

  if (sink && sink(passenger, amount)) {
    return std::nullopt;
  }

  spdlog::warn("Transfer of {} gwei to {} refused; restoring credit", amount,
               to_hex(passenger));
  state = totals();
  state.credit_total += amount;
  state.total_paid_out -= amount;
  save(state);
  save_credit(passenger, credit_of(passenger) + amount);
  return error_code::transfer_failed;
}

void fund_ledger::refund(const account_id_t& payer,
                         const amount_t amount,
                         const transfer_sink_t& sink) {
  if (amount == 0) {
    return;
  }
  if (sink && sink(payer, amount)) {
    spdlog::debug("Refunded {} gwei to {}", amount, to_hex(payer));
    return;
  }
  spdlog::warn("Refund of {} gwei to {} refused; holding it as credit", amount,
               to_hex(payer));
  auto state = totals();
  state.credit_total += amount;
  state.total_received += amount;
  save(state);
  save_credit(payer, credit_of(payer) + amount);
}

}  // namespace surety::execution
