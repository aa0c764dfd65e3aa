#pragma once

#include <surety/blake3/hash.hpp>
#include <surety/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>

// Schema key type: registry keys.
// Canonical key prefixes per owning component. A component only touches keys
// under its own prefixes.
namespace surety::schema::key {

inline constexpr std::string_view kAccessOwnerKey{"SURETY|ACCESS|OWNER"};
inline constexpr std::string_view kAccessOperationalKey{
    "SURETY|ACCESS|OPERATIONAL"};
inline constexpr std::string_view kAccessAuthorizedPrefix{
    "SURETY|ACCESS|AUTHORIZED|"};
inline constexpr std::string_view kAirlinePrefix{"SURETY|AIRLINE|"};
inline constexpr std::string_view kAirlineCountKey{"SURETY|AIRLINE_COUNT"};
inline constexpr std::string_view kVotePrefix{"SURETY|VOTE|"};
inline constexpr std::string_view kLedgerKey{"SURETY|LEDGER|TOTALS"};
inline constexpr std::string_view kCreditPrefix{"SURETY|CREDIT|"};
inline constexpr std::string_view kFlightPrefix{"SURETY|FLIGHT|"};
inline constexpr std::string_view kClaimPrefix{"SURETY|CLAIM|"};
inline constexpr std::string_view kOraclePrefix{"SURETY|ORACLE|"};
inline constexpr std::string_view kOracleNonceKey{"SURETY|ORACLE_NONCE"};
inline constexpr std::string_view kRequestPrefix{"SURETY|REQUEST|"};

inline const std::array<std::string_view, 13> kRegistryKeyspaces{
    kAccessOwnerKey,  kAccessOperationalKey, kAccessAuthorizedPrefix,
    kAirlinePrefix,   kAirlineCountKey,      kVotePrefix,
    kLedgerKey,       kCreditPrefix,         kFlightPrefix,
    kClaimPrefix,     kOraclePrefix,         kOracleNonceKey,
    kRequestPrefix};

template <typename Encoder, typename T>
surety::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                          std::string_view prefix,
                                          const T& id) {
  // SCALE product types are encoded as concatenated field bytes, so a key
  // for tuple{a, b} starts with the key for a.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
surety::schema::bytes_t make_singleton_key(Encoder& encoder,
                                           std::string_view name) {
  return encoder.encode(name);
}

template <typename Encoder>
surety::schema::bytes_t make_authorized_key(
    Encoder& encoder,
    const surety::schema::account_id_t& caller) {
  return make_prefixed_key(encoder, kAccessAuthorizedPrefix, caller);
}

template <typename Encoder>
surety::schema::bytes_t make_airline_key(
    Encoder& encoder,
    const surety::schema::account_id_t& airline) {
  return make_prefixed_key(encoder, kAirlinePrefix, airline);
}

template <typename Encoder>
surety::schema::bytes_t make_vote_key(
    Encoder& encoder,
    const surety::schema::account_id_t& target) {
  return make_prefixed_key(encoder, kVotePrefix, target);
}

template <typename Encoder>
surety::schema::bytes_t make_credit_key(
    Encoder& encoder,
    const surety::schema::account_id_t& passenger) {
  return make_prefixed_key(encoder, kCreditPrefix, passenger);
}

template <typename Encoder>
surety::schema::bytes_t make_flight_state_key(
    Encoder& encoder,
    const surety::schema::flight_key_t& flight_key) {
  return make_prefixed_key(encoder, kFlightPrefix, flight_key);
}

template <typename Encoder>
surety::schema::bytes_t make_claim_key(
    Encoder& encoder,
    const surety::schema::flight_key_t& flight_key,
    const surety::schema::account_id_t& passenger) {
  return make_prefixed_key(encoder, kClaimPrefix,
                           std::tuple{flight_key, passenger});
}

template <typename Encoder>
surety::schema::bytes_t make_claim_prefix_key(
    Encoder& encoder,
    const surety::schema::flight_key_t& flight_key) {
  return make_prefixed_key(encoder, kClaimPrefix, flight_key);
}

template <typename Encoder>
surety::schema::bytes_t make_oracle_key(
    Encoder& encoder,
    const surety::schema::account_id_t& oracle) {
  return make_prefixed_key(encoder, kOraclePrefix, oracle);
}

template <typename Encoder>
surety::schema::bytes_t make_request_key(
    Encoder& encoder,
    const uint8_t index,
    const surety::schema::account_id_t& airline,
    const std::string& flight,
    const surety::schema::timestamp_seconds_t timestamp) {
  return make_prefixed_key(encoder, kRequestPrefix,
                           std::tuple{index, airline, flight, timestamp});
}

/// Identity of a flight: BLAKE3 over the SCALE encoding of
/// (airline, code, timestamp).
template <typename Encoder>
surety::schema::flight_key_t make_flight_key(
    Encoder& encoder,
    const surety::schema::account_id_t& airline,
    const std::string& code,
    const surety::schema::timestamp_seconds_t timestamp) {
  auto material = encoder.encode(std::tuple{airline, code, timestamp});
  return surety::blake3::hash(
      surety::schema::bytes_view_t{material.data(), material.size()});
}

}  // namespace surety::schema::key
