#include <cascade/schema/error_node.hpp>

#include <iterator>

namespace cascade::schema {

const error_node* error_node::first_error() const {
  for (const auto& child : children) {
    if (const auto* nested = std::get_if<error_node>(&child)) {
      return nested;
    }
  }
  return nullptr;
}

const error_node* error_node::last_error() const {
  for (auto it = std::rbegin(children); it != std::rend(children); ++it) {
    if (const auto* nested = std::get_if<error_node>(&*it)) {
      return nested;
    }
  }
  return nullptr;
}

error_node* error_node::last_error() {
  for (auto it = std::rbegin(children); it != std::rend(children); ++it) {
    if (auto* nested = std::get_if<error_node>(&*it)) {
      return nested;
    }
  }
  return nullptr;
}

bool operator==(const context_node& lhs, const context_node& rhs) {
  return lhs.attributes == rhs.attributes;
}

bool operator==(const attachment_node& lhs, const attachment_node& rhs) {
  return lhs.name == rhs.name && lhs.attributes == rhs.attributes &&
         lhs.content == rhs.content;
}

bool operator==(const error_node& lhs, const error_node& rhs) {
  return lhs.code == rhs.code && lhs.user_message == rhs.user_message &&
         lhs.developer_message == rhs.developer_message &&
         lhs.source_procedure == rhs.source_procedure &&
         lhs.source_line == rhs.source_line && lhs.children == rhs.children;
}

}  // namespace cascade::schema
