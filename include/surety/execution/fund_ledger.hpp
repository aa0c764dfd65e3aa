#pragma once

#include <surety/execution/backend.hpp>
#include <surety/execution/transfer_sink.hpp>
#include <surety/schema/error_code.hpp>
#include <surety/schema/ledger_state.hpp>
#include <surety/schema/primitives.hpp>
#include <optional>

namespace surety::execution {

/// Sole owner of every balance the registry holds. Other components move
/// value only through these entry points.
class fund_ledger final {
 public:
  fund_ledger(encoder_t& encoder, storage_t& storage);

  void deposit_escrow(surety::schema::amount_t amount);
  void deposit_pool(surety::schema::amount_t amount);
  void deposit_oracle_fee(surety::schema::amount_t amount);

  /// Move `amount` to the passenger's credit, drawing on the insurance pool
  /// first and on funded airline escrow for any shortfall. Fails with
  /// pool_underfunded and leaves balances untouched when both together
  /// cannot cover it.
  std::optional<surety::schema::error_code> credit_payout(
      const surety::schema::account_id_t& passenger,
      surety::schema::amount_t amount);

  /// Debit the passenger's credit, then transfer. The debit is restored if
  /// the sink refuses.
  std::optional<surety::schema::error_code> withdraw(
      const surety::schema::account_id_t& passenger,
      surety::schema::amount_t amount,
      const transfer_sink_t& sink);

  /// Return excess payment that was never accepted. Falls back to crediting
  /// the payer when the sink refuses.
  void refund(const surety::schema::account_id_t& payer,
              surety::schema::amount_t amount,
              const transfer_sink_t& sink);

  surety::schema::ledger_state_t totals() const;
  surety::schema::amount_t credit_of(
      const surety::schema::account_id_t& passenger) const;

 private:
  void save(const surety::schema::ledger_state_t& totals);
  void save_credit(const surety::schema::account_id_t& passenger,
                   surety::schema::amount_t amount);

  encoder_t& encoder_;
  storage_t& storage_;
};

}  // namespace surety::execution
