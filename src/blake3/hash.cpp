#include <blake3.h>
#include <surety/blake3/hash.hpp>

namespace surety::blake3 {

namespace {

surety::schema::hash32_t digest(const void* data, const std::size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = surety::schema::hash32_t{};
  static_assert(sizeof(output) == BLAKE3_OUT_LEN);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

surety::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

surety::schema::hash32_t hash(const surety::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace surety::blake3
