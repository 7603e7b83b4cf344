#include <cascade/wire/codec.hpp>
#include <cascade/wire/truncation.hpp>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <variant>

namespace cascade::wire {

namespace {

template <typename Predicate>
bool erase_last_child(schema::error_node& node, Predicate predicate) {
  auto it = std::find_if(std::rbegin(node.children), std::rend(node.children),
                         predicate);
  if (it == std::rend(node.children)) {
    return false;
  }
  node.children.erase(std::next(it).base());
  return true;
}

bool is_attachment(const schema::node_child_t& child) {
  return std::holds_alternative<schema::attachment_node>(child);
}

bool is_error(const schema::node_child_t& child) {
  return std::holds_alternative<schema::error_node>(child);
}

bool is_context(const schema::node_child_t& child) {
  return std::holds_alternative<schema::context_node>(child);
}

}  // namespace

std::optional<schema::error_node> reduce(const schema::error_node& node) {
  auto reduced = node;
  if (erase_last_child(reduced, is_attachment)) {
    return reduced;
  }
  if (auto* last = reduced.last_error();
      last != nullptr && erase_last_child(*last, is_error)) {
    return reduced;
  }
  if (erase_last_child(reduced, is_error)) {
    return reduced;
  }
  if (erase_last_child(reduced, is_context)) {
    return reduced;
  }
  if (reduced.developer_message) {
    reduced.developer_message.reset();
    return reduced;
  }
  return std::nullopt;
}

std::size_t character_count(const std::string_view text) {
  return static_cast<std::size_t>(
      std::count_if(std::begin(text), std::end(text), [](const char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
      }));
}

std::string fit(const schema::error_node& node,
                const std::size_t budget,
                const bool limited) {
  auto encoded = encode(node);
  if (!limited || character_count(encoded) <= budget) {
    return encoded;
  }

  auto current = node;
  auto steps = std::size_t{0};
  while (character_count(encoded) > budget) {
    auto reduced = reduce(current);
    if (!reduced) {
      spdlog::warn("Structured error of {} characters exceeds budget {}",
                   character_count(encoded), budget);
      break;
    }
    current = std::move(*reduced);
    encoded = encode(current);
    ++steps;
  }
  spdlog::debug("Truncated structured error in {} step(s) to {} characters",
                steps, character_count(encoded));
  return encoded;
}

}  // namespace cascade::wire
