#include <blake3.h>
#include <sigil/blake3/hash.hpp>

namespace sigil::blake3 {

namespace {

sigil::schema::hash32_t digest(const void* data, const std::size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = sigil::schema::hash32_t{};
  static_assert(sizeof(output) == BLAKE3_OUT_LEN);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

sigil::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

sigil::schema::hash32_t hash(const sigil::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace sigil::blake3
