#pragma once

#include <surety/schema/primitives.hpp>
#include <array>

// Schema type: oracle registration.
namespace surety::schema {

using oracle_indexes_t = std::array<uint8_t, 3>;

template <uint16_t Version>
struct oracle_registration;

template <>
struct oracle_registration<1> final {
  uint16_t version{1};
  account_id_t oracle;
  oracle_indexes_t indexes{};
};

using oracle_registration_t = oracle_registration<1>;

}  // namespace surety::schema
