#pragma once

#include <surety/execution/access_control.hpp>
#include <surety/execution/airline_registry.hpp>
#include <surety/execution/backend.hpp>
#include <surety/execution/config.hpp>
#include <surety/execution/entropy_source.hpp>
#include <surety/execution/flight_registry.hpp>
#include <surety/execution/fund_ledger.hpp>
#include <surety/execution/insurance_pool.hpp>
#include <surety/execution/oracle_consensus.hpp>
#include <surety/execution/transfer_sink.hpp>
#include <surety/schema/call_context.hpp>
#include <surety/schema/call_result.hpp>
#include <surety/schema/flight_status.hpp>
#include <surety/schema/ledger_state.hpp>
#include <surety/schema/oracle_registration.hpp>
#include <surety/schema/primitives.hpp>
#include <surety/schema/response_request.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace surety::execution {

/// Airline insurance registry.
///
/// Wires access control, airline admission, the fund ledger, flights,
/// insurance and oracle consensus over one store. Calls are serialized; the
/// mutex is recursive so a transfer sink may re-enter the engine and observe
/// already-settled balances.
///
/// Every state-changing call other than the owner's administration requires
/// the registry to be operational and `ctx.caller` to be authorized.
class engine final {
 public:
  /// Bootstraps owner, operational flag and first airline on a fresh store;
  /// reloads them otherwise.
  explicit engine(encoder_t& encoder,
                  storage_t& storage,
                  engine_config config,
                  entropy_source_t entropy = {},
                  transfer_sink_t sink = {});

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// Install the transfer sink used for refunds and withdrawals.
  void set_transfer_sink(transfer_sink_t sink);

  // Owner administration.
  surety::schema::call_result_t authorize(
      const surety::schema::account_id_t& requester,
      const surety::schema::account_id_t& caller);
  surety::schema::call_result_t revoke(
      const surety::schema::account_id_t& requester,
      const surety::schema::account_id_t& caller);
  surety::schema::call_result_t set_operational(
      const surety::schema::account_id_t& requester,
      bool operational);

  // Airlines.
  surety::schema::call_result_t register_airline(
      const surety::schema::call_context_t& ctx,
      const surety::schema::account_id_t& target);
  surety::schema::call_result_t pay_membership_fund(
      const surety::schema::call_context_t& ctx);
  surety::schema::call_result_t register_flight(
      const surety::schema::call_context_t& ctx,
      const std::string& code,
      surety::schema::timestamp_seconds_t timestamp);
  surety::schema::call_result_t set_flight_status(
      const surety::schema::call_context_t& ctx,
      const std::string& code,
      surety::schema::timestamp_seconds_t timestamp,
      surety::schema::flight_status_t status);

  // Passengers.
  surety::schema::call_result_t buy_insurance(
      const surety::schema::call_context_t& ctx,
      const surety::schema::account_id_t& passenger,
      const surety::schema::account_id_t& airline,
      const std::string& code,
      surety::schema::timestamp_seconds_t timestamp,
      surety::schema::amount_t amount);
  surety::schema::call_result_t withdraw(
      const surety::schema::call_context_t& ctx,
      surety::schema::amount_t amount);

  // Oracles.
  surety::schema::call_result_t register_oracle(
      const surety::schema::call_context_t& ctx);
  surety::schema::call_result_t request_flight_status(
      const surety::schema::call_context_t& ctx,
      const surety::schema::account_id_t& airline,
      const std::string& code,
      surety::schema::timestamp_seconds_t timestamp);
  surety::schema::call_result_t submit_response(
      const surety::schema::call_context_t& ctx,
      uint8_t index,
      const surety::schema::account_id_t& airline,
      const std::string& code,
      surety::schema::timestamp_seconds_t timestamp,
      surety::schema::flight_status_t status);

  // Queries.
  bool is_operational() const;
  bool is_authorized(const surety::schema::account_id_t& caller) const;
  uint32_t registered_airline_count() const;
  bool is_airline_registered(const surety::schema::account_id_t& airline) const;
  bool is_airline_paid(const surety::schema::account_id_t& airline) const;
  bool is_airline_pending(const surety::schema::account_id_t& airline) const;
  uint32_t pending_votes(const surety::schema::account_id_t& target) const;
  std::optional<surety::schema::flight_status_t> flight_status(
      const surety::schema::account_id_t& airline,
      const std::string& code,
      surety::schema::timestamp_seconds_t timestamp) const;
  std::optional<surety::schema::flight_state_t> find_flight(
      const surety::schema::account_id_t& airline,
      const std::string& code,
      surety::schema::timestamp_seconds_t timestamp) const;
  surety::schema::amount_t insurance_amount(
      const surety::schema::account_id_t& passenger,
      const surety::schema::account_id_t& airline,
      const std::string& code,
      surety::schema::timestamp_seconds_t timestamp) const;
  surety::schema::amount_t passenger_balance(
      const surety::schema::account_id_t& passenger) const;
  bool is_oracle_registered(const surety::schema::account_id_t& oracle) const;
  std::optional<surety::schema::oracle_indexes_t> oracle_indexes(
      const surety::schema::account_id_t& oracle) const;
  std::optional<surety::schema::response_request_t> find_request(
      uint8_t index,
      const surety::schema::account_id_t& airline,
      const std::string& code,
      surety::schema::timestamp_seconds_t timestamp) const;
  surety::schema::ledger_state_t ledger_totals() const;
  const engine_config& config() const;

 private:
  /// Pay out insurees and fold the payout events into `result` when
  /// `status` is a delay.
  void settle_delay(const surety::schema::flight_key_t& flight_key,
                    surety::schema::flight_status_t status,
                    surety::schema::call_result_t& result);
  bool transfer(const surety::schema::account_id_t& recipient,
                surety::schema::amount_t amount);

  mutable std::recursive_mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  engine_config config_;
  transfer_sink_t sink_;
  transfer_sink_t dispatch_;
  access_control access_;
  fund_ledger ledger_;
  airline_registry airlines_;
  flight_registry flights_;
  insurance_pool insurance_;
  oracle_consensus oracles_;
};

}  // namespace surety::execution
