#pragma once

#include <surety/execution/airline_registry.hpp>
#include <surety/execution/backend.hpp>
#include <surety/execution/config.hpp>
#include <surety/execution/flight_registry.hpp>
#include <surety/execution/fund_ledger.hpp>
#include <surety/execution/transfer_sink.hpp>
#include <surety/schema/call_result.hpp>
#include <surety/schema/insurance_claim.hpp>
#include <surety/schema/primitives.hpp>
#include <optional>
#include <string>
#include <vector>

namespace surety::execution {

/// Premium intake, delay payouts and passenger withdrawals.
class insurance_pool final {
 public:
  insurance_pool(encoder_t& encoder,
                 storage_t& storage,
                 fund_ledger& ledger,
                 const flight_registry& flights,
                 const airline_registry& airlines,
                 const engine_config& config);

  surety::schema::call_result_t buy_insurance(
      const surety::schema::account_id_t& payer,
      const surety::schema::account_id_t& passenger,
      const surety::schema::account_id_t& airline,
      const std::string& code,
      surety::schema::timestamp_seconds_t timestamp,
      surety::schema::amount_t declared_amount,
      surety::schema::amount_t paid_amount,
      const transfer_sink_t& sink);

  /// Credit premium * 3 / 2 for every unpaid claim on the flight. Claims the
  /// pool cannot cover stay unpaid and are listed in `info`; the rest are
  /// still credited. Already-paid claims are skipped.
  surety::schema::call_result_t credit_insurees(
      const surety::schema::flight_key_t& flight_key);

  surety::schema::call_result_t withdraw(
      const surety::schema::account_id_t& passenger,
      surety::schema::amount_t amount,
      const transfer_sink_t& sink);

  std::optional<surety::schema::insurance_claim_t> find(
      const surety::schema::flight_key_t& flight_key,
      const surety::schema::account_id_t& passenger) const;
  std::vector<surety::schema::insurance_claim_t> claims_for(
      const surety::schema::flight_key_t& flight_key) const;

  static surety::schema::amount_t payout_for(
      surety::schema::amount_t premium);

 private:
  void save(const surety::schema::insurance_claim_t& claim);

  encoder_t& encoder_;
  storage_t& storage_;
  fund_ledger& ledger_;
  const flight_registry& flights_;
  const airline_registry& airlines_;
  const engine_config& config_;
};

}  // namespace surety::execution
