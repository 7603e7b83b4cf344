#pragma once
#include <boost/endian/conversion.hpp>
#include <cascade/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace cascade::schema::key {

/// Storage key under construction. Integers are written big-endian so that
/// keys of one prefix iterate in numeric order.
struct builder final {
  cascade::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  /// Write the length of `str` followed by its bytes, so that adjacent
  /// fields never run into each other.
  builder& field(const std::string_view& str);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    auto big = boost::endian::native_to_big(value);
    auto* raw = reinterpret_cast<const uint8_t*>(&big);
    data.insert(data.end(), raw, raw + sizeof(T));
    return *this;
  }
};

}  // namespace cascade::schema::key
