#pragma once
#include <liquidity/schema/primitives.hpp>
#include <optional>
#include <span>

namespace liquidity::schema::encoding {

// The codec is a build-time choice: callers name a library tag and get the
// matching specialization. Only SCALE is provided.
template <typename Library>
struct encoder {
  template <typename T>
  liquidity::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, liquidity::schema::bytes_t& out);

  template <typename T>
  T decode(const liquidity::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const liquidity::schema::bytes_view_t& bytes);
};

}  // namespace liquidity::schema::encoding
