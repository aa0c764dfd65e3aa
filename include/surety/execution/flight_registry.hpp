#pragma once

#include <surety/execution/airline_registry.hpp>
#include <surety/execution/backend.hpp>
#include <surety/schema/call_result.hpp>
#include <surety/schema/flight_state.hpp>
#include <surety/schema/flight_status.hpp>
#include <surety/schema/primitives.hpp>
#include <optional>
#include <string>

namespace surety::execution {

/// Flight existence and status, keyed by hash(airline, code, timestamp).
///
/// Status has two writers: the owning airline and oracle quorum. Once an
/// oracle round has resolved a flight, direct airline updates are refused;
/// later oracle rounds still overwrite.
class flight_registry final {
 public:
  flight_registry(encoder_t& encoder,
                  storage_t& storage,
                  const airline_registry& airlines);

  /// `data` carries the SCALE-encoded flight key.
  surety::schema::call_result_t register_flight(
      const surety::schema::account_id_t& airline,
      const std::string& code,
      surety::schema::timestamp_seconds_t timestamp);

  surety::schema::call_result_t set_status(
      const surety::schema::account_id_t& airline,
      const std::string& code,
      surety::schema::timestamp_seconds_t timestamp,
      surety::schema::flight_status_t status);

  /// Oracle resolution callback. Fails only with unknown_flight.
  surety::schema::call_result_t apply_resolution(
      const surety::schema::flight_key_t& key,
      surety::schema::flight_status_t status);

  surety::schema::flight_key_t key_of(
      const surety::schema::account_id_t& airline,
      const std::string& code,
      surety::schema::timestamp_seconds_t timestamp) const;
  std::optional<surety::schema::flight_state_t> find(
      const surety::schema::flight_key_t& key) const;

 private:
  void save(const surety::schema::flight_state_t& flight);

  encoder_t& encoder_;
  storage_t& storage_;
  const airline_registry& airlines_;
};

}  // namespace surety::execution
