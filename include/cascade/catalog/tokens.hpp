#pragma once

#include <cascade/schema/error_node.hpp>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cascade::catalog {

inline constexpr auto kChildMessageToken = std::string_view{"ChildMessage"};
inline constexpr auto kProcedureNameToken = std::string_view{"ProcedureName"};
inline constexpr auto kErrorNameToken = std::string_view{"ErrorName"};
inline constexpr auto kErrorIdToken = std::string_view{"ErrorId"};

/// Context keys that are elevated to the node being built instead of being
/// substituted: procedure id -> P, line -> L. LimitLength is an option of
/// lookup().
inline constexpr auto kProcedureIdKey = std::string_view{"PROCID"};
inline constexpr auto kLineKey = std::string_view{"LINE"};
inline constexpr auto kLimitLengthKey = std::string_view{"LimitLength"};

/// Ordered token name -> value mapping used to render message templates.
/// Names are case-sensitive; a null value renders as the empty string.
class token_set final {
 public:
  using value_type = std::pair<std::string, std::optional<std::string>>;

  token_set() = default;
  token_set(std::initializer_list<value_type> tokens);

  /// Insert or replace `name` (last write wins).
  void set(std::string name, std::optional<std::string> value);
  /// Insert `name` only when it is not present yet.
  bool set_default(std::string name, std::optional<std::string> value);
  /// Remove `name`; returns the removed value when it was present.
  std::optional<std::optional<std::string>> take(std::string_view name);

  bool contains(std::string_view name) const;
  const std::optional<std::string>* find(std::string_view name) const;

  bool empty() const { return tokens_.empty(); }
  std::size_t size() const { return tokens_.size(); }
  auto begin() const { return tokens_.begin(); }
  auto end() const { return tokens_.end(); }

 private:
  std::vector<value_type> tokens_;
};

/// Replace every `#name#` in `text` by the value of token `name`.
/// Placeholders without a token are left as they are.
std::string substitute(std::string_view text, const token_set& tokens);

/// Replace `#ChildMessage#` by the message of `child` (the developer message
/// when `developer` is set, falling back to the user message), or by nothing
/// when there is no child.
std::string substitute_child_message(std::string_view text,
                                     const schema::error_node* child,
                                     bool developer);

/// Replace all occurrences of `from` in `text` by `to`.
std::string replace_all(std::string_view text,
                        std::string_view from,
                        std::string_view to);

}  // namespace cascade::catalog
