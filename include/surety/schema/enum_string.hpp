#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace surety::schema {

template <typename Enum>
using enum_mapping_t = std::pair<std::string_view, Enum>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> enum_from_string(
    const std::string_view value,
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
  auto found = std::ranges::find(mappings, value, &enum_mapping_t<Enum>::first);
  if (found == std::end(mappings)) {
    return std::nullopt;
  }
  return found->second;
}

template <typename Enum, std::size_t N>
constexpr std::string_view enum_name(
    const Enum value,
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
  auto found = std::ranges::find(mappings, value, &enum_mapping_t<Enum>::second);
  if (found == std::end(mappings)) {
    return "unknown";
  }
  return found->first;
}

}  // namespace surety::schema
