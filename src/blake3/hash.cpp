#include <blake3.h>
#include <liquidity/blake3/hash.hpp>

namespace liquidity::blake3 {

namespace {

liquidity::schema::hash32_t digest(const void* data, const std::size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  // BLAKE3_OUT_LEN
  auto output = liquidity::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

liquidity::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

liquidity::schema::hash32_t hash(const liquidity::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace liquidity::blake3
