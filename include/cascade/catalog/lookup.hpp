#pragma once

#include <cascade/catalog/catalog.hpp>
#include <cascade/catalog/tokens.hpp>
#include <cascade/schema/error_node.hpp>
#include <cascade/wire/truncation.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cascade::catalog {

struct resolved_error final {
  schema::error_code_t code{};
  std::string user_message;
  std::optional<std::string> developer_message;
  /// Set when the exact (procedure, error name) entry was missing.
  bool fallback{false};
};

/// Resolve the templates of (procedure_name, error_name) and render them.
///
/// Resolution order: exact entry, then ErrorHandler/UnknownError, then the
/// builtin template. `tokens` receives the injected ProcedureName/ErrorName
/// entries (caller-supplied values win) and, on fallback, the resolved
/// ErrorId. `child` is the nested error that feeds `#ChildMessage#`.
resolved_error resolve(const catalog& errors,
                       std::string_view procedure_name,
                       std::string_view error_name,
                       token_set& tokens,
                       const schema::error_node* child = nullptr);

/// Build the structured error for (procedure_name, error_name).
///
/// `arguments` become the first children of the new node, in order. The
/// attributes of its top-level "T" elements are the substitution tokens; its
/// first "E" element feeds `#ChildMessage#`. PROCID and LINE are elevated to
/// the node's procedure and line and removed from the "T" elements, as is
/// LimitLength. "T" elements left without attributes are dropped.
schema::error_node make_error(const catalog& errors,
                              std::string_view procedure_name,
                              std::string_view error_name,
                              std::vector<schema::node_child_t> arguments = {});

/// make_error() followed by wire::fit(). A falsy LimitLength argument turns
/// truncation off.
std::string lookup(const catalog& errors,
                   std::string_view procedure_name,
                   std::string_view error_name,
                   std::vector<schema::node_child_t> arguments = {},
                   std::size_t budget = wire::kDefaultBudget);

/// Turn signaled failure text back into a tree.
///
/// Encoded trees are used as they are; any other text becomes the
/// ChildMessage of a new ErrorHandler/UnknownError node. `before` is inserted
/// as the first child of the root and `after` appended as the last one; empty
/// context nodes are skipped.
schema::error_node wrap(const catalog& errors,
                        std::string_view raw_message,
                        const std::optional<schema::context_node>& before =
                            std::nullopt,
                        const std::optional<schema::context_node>& after =
                            std::nullopt);

}  // namespace cascade::catalog
