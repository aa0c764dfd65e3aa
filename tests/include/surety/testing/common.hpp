#pragma once

#include <surety/execution/entropy_source.hpp>
#include <surety/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace surety::testing {

inline surety::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = surety::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline surety::schema::account_id_t make_account(const uint8_t seed) {
  auto account = surety::schema::account_id_t{};
  account[0] = 0xA0;
  account[31] = seed;
  return account;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Entropy whose derived index follows `indexes`, cycling once exhausted.
inline surety::execution::entropy_source_t make_scripted_entropy(
    std::vector<uint8_t> indexes) {
  auto position = std::make_shared<std::size_t>(0);
  return [indexes = std::move(indexes), position](
             const surety::schema::account_id_t&, uint64_t) {
    auto entropy = surety::schema::hash32_t{};
    entropy[0] = indexes[*position % indexes.size()];
    ++*position;
    return entropy;
  };
}

}  // namespace surety::testing
