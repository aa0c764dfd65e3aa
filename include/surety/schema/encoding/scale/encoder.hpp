#pragma once
#include <surety/common/critical.hpp>
#include <surety/schema/airline_state.hpp>
#include <surety/schema/encoding/encoder.hpp>
#include <surety/schema/encoding/scale/airline_status.hpp>
#include <surety/schema/encoding/scale/flight_status.hpp>
#include <surety/schema/flight_state.hpp>
#include <surety/schema/insurance_claim.hpp>
#include <surety/schema/ledger_state.hpp>
#include <surety/schema/oracle_registration.hpp>
#include <surety/schema/pending_registration.hpp>
#include <surety/schema/response_request.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace surety::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  surety::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, surety::schema::bytes_t& out);

  template <typename T>
  T decode(const surety::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const surety::schema::bytes_view_t& bytes);
};

template <typename T>
surety::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    surety::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        surety::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const surety::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    surety::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const surety::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace surety::schema::encoding
