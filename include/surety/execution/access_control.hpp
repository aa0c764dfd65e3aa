#pragma once

#include <surety/execution/backend.hpp>
#include <surety/schema/call_result.hpp>
#include <surety/schema/primitives.hpp>
#include <optional>

namespace surety::execution {

/// Owner-administered gate: the authorized caller set and the operational
/// circuit breaker.
class access_control final {
 public:
  access_control(encoder_t& encoder, storage_t& storage);

  /// Persist owner and enable operation on a fresh store. Returns false when
  /// the store was already bootstrapped.
  bool bootstrap(const surety::schema::account_id_t& owner);

  surety::schema::call_result_t authorize(
      const surety::schema::account_id_t& requester,
      const surety::schema::account_id_t& caller);
  surety::schema::call_result_t revoke(
      const surety::schema::account_id_t& requester,
      const surety::schema::account_id_t& caller);
  /// Allowed while paused so the owner can re-enable.
  surety::schema::call_result_t set_operational(
      const surety::schema::account_id_t& requester,
      bool operational);

  /// Rejection for a state-changing call from `caller`, or std::nullopt when
  /// the call may proceed.
  std::optional<surety::schema::call_result_t> check(
      const surety::schema::account_id_t& caller) const;

  bool is_operational() const;
  bool is_authorized(const surety::schema::account_id_t& caller) const;
  std::optional<surety::schema::account_id_t> owner() const;

 private:
  std::optional<surety::schema::call_result_t> require_owner(
      const surety::schema::account_id_t& requester) const;

  encoder_t& encoder_;
  storage_t& storage_;
};

}  // namespace surety::execution
