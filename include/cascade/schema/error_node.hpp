#pragma once

#include <cascade/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Schema type: structured error node.
// Error workflow: One (possibly nested) failure. Crosses frame boundaries in
// the wire encoding of cascade/wire/codec.hpp.
namespace cascade::schema {

/// "T" element: diagnostic attributes attached to an error node.
struct context_node final {
  attribute_list_t attributes;

  bool empty() const { return attributes.empty(); }
};

/// Any child element that is neither "T" nor "E". The content between the
/// start and end tag is kept verbatim.
struct attachment_node final {
  std::string name;
  attribute_list_t attributes;
  std::string content;
};

struct error_node;

using node_child_t = std::variant<context_node, attachment_node, error_node>;

/// "E" element.
struct error_node final {
  error_code_t code{};
  std::string user_message;
  std::optional<std::string> developer_message;
  std::string source_procedure;
  std::optional<int32_t> source_line;
  std::vector<node_child_t> children;

  /// First nested error child, or nullptr.
  const error_node* first_error() const;
  /// Last nested error child, or nullptr.
  const error_node* last_error() const;
  error_node* last_error();
};

bool operator==(const context_node& lhs, const context_node& rhs);
bool operator==(const attachment_node& lhs, const attachment_node& rhs);
bool operator==(const error_node& lhs, const error_node& rhs);

}  // namespace cascade::schema
