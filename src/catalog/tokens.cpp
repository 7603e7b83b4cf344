#include <cascade/catalog/tokens.hpp>

#include <algorithm>
#include <iterator>

namespace cascade::catalog {

token_set::token_set(std::initializer_list<value_type> tokens) {
  for (const auto& [name, value] : tokens) {
    set(name, value);
  }
}

void token_set::set(std::string name, std::optional<std::string> value) {
  auto existing =
      std::find_if(std::begin(tokens_), std::end(tokens_),
                   [&](const value_type& token) { return token.first == name; });
  if (existing != std::end(tokens_)) {
    existing->second = std::move(value);
    return;
  }
  tokens_.emplace_back(std::move(name), std::move(value));
}

bool token_set::set_default(std::string name,
                            std::optional<std::string> value) {
  if (contains(name)) {
    return false;
  }
  tokens_.emplace_back(std::move(name), std::move(value));
  return true;
}

std::optional<std::optional<std::string>> token_set::take(
    const std::string_view name) {
  auto existing =
      std::find_if(std::begin(tokens_), std::end(tokens_),
                   [&](const value_type& token) { return token.first == name; });
  if (existing == std::end(tokens_)) {
    return std::nullopt;
  }
  auto value = std::move(existing->second);
  tokens_.erase(existing);
  return value;
}

bool token_set::contains(const std::string_view name) const {
  return find(name) != nullptr;
}

const std::optional<std::string>* token_set::find(
    const std::string_view name) const {
  for (const auto& [token_name, value] : tokens_) {
    if (token_name == name) {
      return &value;
    }
  }
  return nullptr;
}

std::string replace_all(const std::string_view text,
                        const std::string_view from,
                        const std::string_view to) {
  auto out = std::string{};
  if (from.empty()) {
    out.assign(text);
    return out;
  }
  out.reserve(text.size());
  auto pos = std::size_t{0};
  while (true) {
    auto found = text.find(from, pos);
    if (found == std::string_view::npos) {
      out.append(text.substr(pos));
      return out;
    }
    out.append(text.substr(pos, found - pos));
    out.append(to);
    pos = found + from.size();
  }
}

std::string substitute(const std::string_view text, const token_set& tokens) {
  auto out = std::string{text};
  for (const auto& [name, value] : tokens) {
    auto placeholder = "#" + name + "#";
    out = replace_all(out, placeholder, value.value_or(std::string{}));
  }
  return out;
}

std::string substitute_child_message(const std::string_view text,
                                     const schema::error_node* child,
                                     const bool developer) {
  static const auto kPlaceholder = "#" + std::string{kChildMessageToken} + "#";
  if (text.find(kPlaceholder) == std::string_view::npos) {
    return std::string{text};
  }
  auto message = std::string{};
  if (child != nullptr) {
    message = developer ? child->developer_message.value_or(child->user_message)
                        : child->user_message;
  }
  return replace_all(text, kPlaceholder, message);
}

}  // namespace cascade::catalog
