#pragma once

#include <surety/schema/primitives.hpp>
#include <cstdint>
#include <functional>

namespace surety::execution {

/// Source of pseudo-random material for oracle index assignment. Called with
/// the account being served and a strictly increasing nonce.
using entropy_source_t =
    std::function<surety::schema::hash32_t(
        const surety::schema::account_id_t& account,
        uint64_t nonce)>;

/// BLAKE3 over (seed, account, nonce).
entropy_source_t make_seeded_entropy_source(
    const surety::schema::hash32_t& seed);

/// Reduce entropy to an index in [0, range): little-endian u64 of the first
/// eight bytes, modulo range.
uint8_t index_from_entropy(const surety::schema::hash32_t& entropy,
                           uint8_t range);

}  // namespace surety::execution
