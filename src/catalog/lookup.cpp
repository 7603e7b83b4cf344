#include <cascade/catalog/lookup.hpp>
#include <cascade/config/configuration.hpp>
#include <cascade/wire/codec.hpp>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>
#include <string>
#include <utility>

namespace cascade::catalog {

namespace {

bool equals_ignore_case(const std::string_view lhs, const std::string_view rhs) {
  return lhs.size() == rhs.size() &&
         std::equal(std::begin(lhs), std::end(lhs), std::begin(rhs),
                    [](const char a, const char b) {
                      return std::toupper(static_cast<unsigned char>(a)) ==
                             std::toupper(static_cast<unsigned char>(b));
                    });
}

/// Spelling of reserved key `name` used in the token set, matched in any
/// case, or std::nullopt when `name` is not reserved.
std::optional<std::string_view> reserved_key(const std::string_view name) {
  for (const auto key : {kProcedureIdKey, kLineKey, kLimitLengthKey}) {
    if (equals_ignore_case(name, key)) {
      return key;
    }
  }
  return std::nullopt;
}

bool is_reserved_key(const std::string_view name) {
  return reserved_key(name).has_value();
}

std::optional<int32_t> parse_int32(const std::optional<std::string>& text) {
  if (!text) {
    return std::nullopt;
  }
  auto value = int32_t{};
  auto [end, error] =
      std::from_chars(text->data(), text->data() + text->size(), value);
  if (error != std::errc{} || end != text->data() + text->size()) {
    return std::nullopt;
  }
  return value;
}

token_set collect_tokens(const std::vector<schema::node_child_t>& arguments) {
  auto tokens = token_set{};
  for (const auto& argument : arguments) {
    const auto* context = std::get_if<schema::context_node>(&argument);
    if (context == nullptr) {
      continue;
    }
    for (const auto& [name, value] : context->attributes) {
      if (name.empty()) {
        continue;
      }
      if (auto key = reserved_key(name)) {
        tokens.set(std::string{*key}, value);
      } else {
        tokens.set(name, value);
      }
    }
  }
  return tokens;
}

const schema::error_node* first_error(
    const std::vector<schema::node_child_t>& children) {
  for (const auto& child : children) {
    if (const auto* nested = std::get_if<schema::error_node>(&child)) {
      return nested;
    }
  }
  return nullptr;
}

void remove_empty_contexts(schema::error_node& node) {
  std::erase_if(node.children, [](const schema::node_child_t& child) {
    const auto* context = std::get_if<schema::context_node>(&child);
    return context != nullptr && context->empty();
  });
  for (auto& child : node.children) {
    if (auto* nested = std::get_if<schema::error_node>(&child)) {
      remove_empty_contexts(*nested);
    }
  }
}

}  // namespace

resolved_error resolve(const catalog& errors,
                       const std::string_view procedure_name,
                       const std::string_view error_name,
                       token_set& tokens,
                       const schema::error_node* child) {
  tokens.set_default(std::string{kProcedureNameToken},
                     std::string{procedure_name});
  tokens.set_default(std::string{kErrorNameToken}, std::string{error_name});

  auto resolved = resolved_error{};
  const auto* definition = errors.find(procedure_name, error_name);
  if (definition == nullptr) {
    resolved.fallback = true;
    definition = errors.find(kFallbackProcedure, kUnknownError);
    if (definition == nullptr) {
      spdlog::warn("Error catalog has no {}/{} entry; using builtin template",
                   kFallbackProcedure, kUnknownError);
    } else {
      spdlog::debug("Error {}/{} not in catalog; falling back to {}/{}",
                    procedure_name, error_name, kFallbackProcedure,
                    kUnknownError);
    }
  }

  auto user_template = std::string{kBuiltinUserMessage};
  auto developer_template = std::optional<std::string>{};
  resolved.code = kBuiltinErrorId;
  if (definition != nullptr) {
    resolved.code = definition->error_id;
    user_template = definition->user_message;
    developer_template = definition->developer_message;
  }
  if (resolved.fallback) {
    tokens.set_default(std::string{kErrorIdToken},
                       std::to_string(resolved.code));
  }

  resolved.user_message = substitute_child_message(
      substitute(user_template, tokens), child, false);
  if (developer_template) {
    resolved.developer_message = substitute_child_message(
        substitute(*developer_template, tokens), child, true);
  }
  return resolved;
}

schema::error_node make_error(const catalog& errors,
                              const std::string_view procedure_name,
                              const std::string_view error_name,
                              std::vector<schema::node_child_t> arguments) {
  auto tokens = collect_tokens(arguments);
  auto procedure_id = tokens.take(kProcedureIdKey);
  auto line = tokens.take(kLineKey);
  tokens.take(kLimitLengthKey);

  auto resolved = resolve(errors, procedure_name, error_name, tokens,
                          first_error(arguments));

  auto node = schema::error_node{};
  node.code = resolved.code;
  node.user_message = std::move(resolved.user_message);
  if (resolved.developer_message &&
      *resolved.developer_message != node.user_message) {
    node.developer_message = std::move(resolved.developer_message);
  }
  node.source_procedure = std::string{procedure_name};
  if (procedure_id) {
    if (auto id = parse_int32(*procedure_id)) {
      if (auto name = errors.procedure_name(*id)) {
        node.source_procedure = std::move(*name);
      }
    }
  }
  if (line) {
    node.source_line = parse_int32(*line);
  }

  node.children = std::move(arguments);
  if (resolved.fallback) {
    auto context = std::find_if(
        std::begin(node.children), std::end(node.children),
        [](const schema::node_child_t& child) {
          return std::holds_alternative<schema::context_node>(child);
        });
    if (context == std::end(node.children)) {
      context = node.children.emplace(std::begin(node.children),
                                      schema::context_node{});
    }
    auto& attributes = std::get<schema::context_node>(*context).attributes;
    if (schema::find_attribute(attributes, kErrorIdToken) == nullptr) {
      attributes.emplace_back(std::string{kErrorIdToken},
                              std::to_string(resolved.code));
    }
  }
  for (auto& child : node.children) {
    if (auto* context = std::get_if<schema::context_node>(&child)) {
      std::erase_if(context->attributes,
                    [](const schema::attribute_t& attribute) {
                      return is_reserved_key(attribute.first);
                    });
    }
  }
  remove_empty_contexts(node);
  return node;
}

std::string lookup(const catalog& errors,
                   const std::string_view procedure_name,
                   const std::string_view error_name,
                   std::vector<schema::node_child_t> arguments,
                   const std::size_t budget) {
  auto limited = true;
  for (const auto& argument : arguments) {
    if (const auto* context = std::get_if<schema::context_node>(&argument)) {
      for (const auto& [name, value] : context->attributes) {
        if (equals_ignore_case(name, kLimitLengthKey)) {
          limited = cascade::config::is_truthy(value);
        }
      }
    }
  }
  auto node = make_error(errors, procedure_name, error_name,
                         std::move(arguments));
  return wire::fit(node, budget, limited);
}

schema::error_node wrap(const catalog& errors,
                        const std::string_view raw_message,
                        const std::optional<schema::context_node>& before,
                        const std::optional<schema::context_node>& after) {
  auto node = wire::try_decode(raw_message);
  if (!node) {
    auto arguments = std::vector<schema::node_child_t>{};
    arguments.emplace_back(schema::context_node{
        {{std::string{kChildMessageToken}, std::string{raw_message}}}});
    node = make_error(errors, kFallbackProcedure, kUnknownError,
                      std::move(arguments));
  }
  if (before && !before->empty()) {
    node->children.emplace(std::begin(node->children), *before);
  }
  if (after && !after->empty()) {
    node->children.emplace_back(*after);
  }
  return std::move(*node);
}

}  // namespace cascade::catalog
