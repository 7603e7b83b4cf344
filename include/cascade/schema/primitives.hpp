#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cascade::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;
using procedure_id_t = int32_t;
using audit_id_t = uint64_t;
using error_code_t = int32_t;

/// Name/value pair of a context, params or attachment element.
using attribute_t = std::pair<std::string, std::string>;
/// Ordered attribute list; names are unique within one list.
using attribute_list_t = std::vector<attribute_t>;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

/// Current UTC wall clock in milliseconds since the epoch.
timestamp_milliseconds_t now_milliseconds();

/// Set `name` to `value`, replacing an existing attribute of the same name.
void set_attribute(attribute_list_t& attributes,
                   std::string name,
                   std::string value);

/// Value of attribute `name`, or nullptr when missing.
const std::string* find_attribute(const attribute_list_t& attributes,
                                  std::string_view name);

}  // namespace cascade::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
