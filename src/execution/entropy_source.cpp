#include <surety/blake3/hash.hpp>
#include <surety/execution/backend.hpp>
#include <surety/execution/entropy_source.hpp>
#include <tuple>

namespace surety::execution {

entropy_source_t make_seeded_entropy_source(
    const surety::schema::hash32_t& seed) {
  return [seed](const surety::schema::account_id_t& account,
                const uint64_t nonce) {
    auto encoder = encoder_t{};
    auto material = encoder.encode(std::tuple{seed, account, nonce});
    return surety::blake3::hash(
        surety::schema::bytes_view_t{material.data(), material.size()});
  };
}

uint8_t index_from_entropy(const surety::schema::hash32_t& entropy,
                           const uint8_t range) {
  auto value = uint64_t{};
  for (size_t i = 0; i < sizeof(value); ++i) {
    value |= static_cast<uint64_t>(entropy[i]) << (i * 8);
  }
  return static_cast<uint8_t>(value % range);
}

}  // namespace surety::execution
