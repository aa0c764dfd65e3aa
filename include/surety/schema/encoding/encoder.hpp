#pragma once
#include <surety/schema/primitives.hpp>
#include <optional>
#include <span>

namespace surety::schema::encoding {

// Codec selected at build time by tag. Storage values and key suffixes go
// through the same encoder so keys stay canonical.
template <typename Library>
struct encoder {
  template <typename T>
  surety::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, surety::schema::bytes_t& out);

  template <typename T>
  T decode(const surety::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const surety::schema::bytes_view_t& bytes);
};

}  // namespace surety::schema::encoding
