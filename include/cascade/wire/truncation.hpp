#pragma once

#include <cascade/schema/error_node.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace cascade::wire {

/// Longest message the signaling channel accepts.
inline constexpr auto kDefaultBudget = std::size_t{2047};

/// Number of characters of UTF-8 `text`. The budget of fit() counts
/// characters, not bytes.
std::size_t character_count(std::string_view text);

/// Apply the first applicable reduction to `node`, in priority order:
///   1. the last root child that is neither a context nor an error element;
///   2. the last error element of the root's last error element;
///   3. the root's last error element;
///   4. the root's last context element;
///   5. the root's developer message.
/// Returns std::nullopt once nothing is left to remove. The root code, user
/// message and procedure are never touched.
std::optional<schema::error_node> reduce(const schema::error_node& node);

/// Encode `node`, reducing it until the text fits `budget` characters when
/// `limited` is set. The result may still exceed `budget` when the irreducible root alone
/// is longer.
std::string fit(const schema::error_node& node,
                std::size_t budget = kDefaultBudget,
                bool limited = true);

}  // namespace cascade::wire
