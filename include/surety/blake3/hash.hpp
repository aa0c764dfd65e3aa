#pragma once
#include <surety/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace surety::blake3 {

surety::schema::hash32_t hash(const std::string_view& str);
surety::schema::hash32_t hash(const surety::schema::bytes_view_t& bytes);

}  // namespace surety::blake3
