#pragma once

#include <surety/execution/backend.hpp>
#include <surety/execution/config.hpp>
#include <surety/execution/entropy_source.hpp>
#include <surety/execution/flight_registry.hpp>
#include <surety/execution/fund_ledger.hpp>
#include <surety/schema/call_result.hpp>
#include <surety/schema/flight_status.hpp>
#include <surety/schema/oracle_registration.hpp>
#include <surety/schema/response_request.hpp>
#include <optional>
#include <string>

namespace surety::execution {

/// Outcome of one oracle report. `resolved` is set on the report that brings
/// some status to quorum; the request is closed at that point.
struct report_outcome final {
  surety::schema::call_result_t result;
  std::optional<surety::schema::flight_status_t> resolved;
  surety::schema::flight_key_t flight_key{};
};

/// Oracle registration, index-sharded status requests and quorum
/// resolution.
class oracle_consensus final {
 public:
  oracle_consensus(encoder_t& encoder,
                   storage_t& storage,
                   fund_ledger& ledger,
                   const flight_registry& flights,
                   entropy_source_t entropy,
                   const engine_config& config);

  /// `data` carries the three assigned indexes.
  surety::schema::call_result_t register_oracle(
      const surety::schema::account_id_t& oracle,
      surety::schema::amount_t payment);

  /// `data` carries the index oracles must hold to answer.
  surety::schema::call_result_t request_status(
      const surety::schema::account_id_t& requester,
      const surety::schema::account_id_t& airline,
      const std::string& flight,
      surety::schema::timestamp_seconds_t timestamp);

  report_outcome submit_response(
      const surety::schema::account_id_t& oracle,
      uint8_t index,
      const surety::schema::account_id_t& airline,
      const std::string& flight,
      surety::schema::timestamp_seconds_t timestamp,
      surety::schema::flight_status_t status);

  std::optional<surety::schema::oracle_indexes_t> indexes_of(
      const surety::schema::account_id_t& oracle) const;
  std::optional<surety::schema::response_request_t> find_request(
      uint8_t index,
      const surety::schema::account_id_t& airline,
      const std::string& flight,
      surety::schema::timestamp_seconds_t timestamp) const;

 private:
  uint8_t next_index(const surety::schema::account_id_t& account);
  surety::schema::oracle_indexes_t assign_indexes(
      const surety::schema::account_id_t& oracle);

  encoder_t& encoder_;
  storage_t& storage_;
  fund_ledger& ledger_;
  const flight_registry& flights_;
  entropy_source_t entropy_;
  const engine_config& config_;
};

}  // namespace surety::execution
