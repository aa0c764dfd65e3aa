#pragma once

#include <surety/execution/backend.hpp>
#include <surety/execution/config.hpp>
#include <surety/execution/fund_ledger.hpp>
#include <surety/execution/transfer_sink.hpp>
#include <surety/schema/airline_state.hpp>
#include <surety/schema/call_result.hpp>
#include <surety/schema/pending_registration.hpp>
#include <surety/schema/primitives.hpp>
#include <cstdint>
#include <optional>

namespace surety::execution {

/// Airline admission state machine.
///
/// While fewer than `consensus_threshold` airlines are registered, any funded
/// airline admits a target directly. From then on each funded airline casts
/// at most one vote per target, and the target is admitted once its distinct
/// voters reach registered_count / multi_party_rate.
class airline_registry final {
 public:
  airline_registry(encoder_t& encoder,
                   storage_t& storage,
                   fund_ledger& ledger,
                   const engine_config& config);

  /// Admit the first airline unconditionally. No-op once any airline exists.
  bool bootstrap(const surety::schema::account_id_t& first_airline);

  /// `data` carries SCALE tuple{bool admitted, uint32_t votes}.
  surety::schema::call_result_t register_airline(
      const surety::schema::account_id_t& voter,
      const surety::schema::account_id_t& target);

  /// Accept exactly `join_fee` into escrow and refund the remainder.
  surety::schema::call_result_t pay_membership_fund(
      const surety::schema::account_id_t& airline,
      surety::schema::amount_t value,
      const transfer_sink_t& sink);

  /// Registered and funded.
  bool is_active(const surety::schema::account_id_t& airline) const;
  bool is_registered(const surety::schema::account_id_t& airline) const;
  bool is_paid(const surety::schema::account_id_t& airline) const;
  bool is_pending(const surety::schema::account_id_t& airline) const;
  uint32_t registered_count() const;
  uint32_t pending_votes(const surety::schema::account_id_t& target) const;
  std::optional<surety::schema::airline_state_t> find(
      const surety::schema::account_id_t& airline) const;

 private:
  surety::schema::airline_state_t load_or_default(
      const surety::schema::account_id_t& airline) const;
  surety::schema::pending_registration_t load_votes(
      const surety::schema::account_id_t& target) const;
  void save(const surety::schema::airline_state_t& state);
  void save(const surety::schema::pending_registration_t& votes);
  void admit(surety::schema::airline_state_t& target,
             surety::schema::call_result_t& result);

  encoder_t& encoder_;
  storage_t& storage_;
  fund_ledger& ledger_;
  const engine_config& config_;
};

}  // namespace surety::execution
