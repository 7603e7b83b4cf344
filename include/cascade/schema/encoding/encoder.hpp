#pragma once
#include <cascade/schema/primitives.hpp>
#include <optional>
#include <span>

namespace cascade::schema::encoding {

// Storage value encoder, selected at build time by tag. The wire grammar of
// structured errors is not an encoder concern; see cascade/wire/codec.hpp.
template <typename Library>
struct encoder {
  template <typename T>
  cascade::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, cascade::schema::bytes_t& out);

  template <typename T>
  T decode(const cascade::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const cascade::schema::bytes_view_t& bytes);
};

}  // namespace cascade::schema::encoding
