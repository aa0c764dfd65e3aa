#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace surety::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = hash32_t;
using flight_key_t = hash32_t;
// Fixed-unit accounting in gwei.
using amount_t = uint64_t;
using timestamp_seconds_t = uint64_t;

inline constexpr amount_t kGwei = 1;
inline constexpr amount_t kEther = 1'000'000'000 * kGwei;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

// Decimal digits only; rejects signs, whitespace, trailing text and overflow.
std::optional<uint64_t> try_parse_uint64(const std::string_view& text);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);

}  // namespace surety::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
