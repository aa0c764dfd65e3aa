#pragma once

#include <surety/schema/primitives.hpp>
#include <vector>

// Schema type: pending registration.
// Distinct voters backing the admission of a target airline. Emptied (never
// removed) once the target is admitted.
namespace surety::schema {

template <uint16_t Version>
struct pending_registration;

template <>
struct pending_registration<1> final {
  uint16_t version{1};
  account_id_t target;
  std::vector<account_id_t> voters;
};

using pending_registration_t = pending_registration<1>;

}  // namespace surety::schema
