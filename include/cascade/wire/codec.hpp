#pragma once

#include <cascade/schema/error_node.hpp>
#include <cascade/schema/primitives.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

// Wire grammar of structured errors.
//
//   <E N="2021003" M="The Branch specified was not found"
//      D="Branch 15 not found or deleted." P="ArticleIsDeletable" L="103">
//     <T EntityId="15" EntityType="2"/>
//     <E .../>
//   </E>
//
//   N  error code            M  user message
//   D  developer message     P  procedure reporting the error
//   L  line where the error was raised
//
// Names are kept to one letter because the encoded text has to fit the
// signaling budget. encode() writes attributes in the order N M D P L and no
// whitespace between elements; try_decode() accepts any attribute order and
// insignificant whitespace.
namespace cascade::wire {

inline constexpr auto kErrorElement = std::string_view{"E"};
inline constexpr auto kContextElement = std::string_view{"T"};

inline constexpr auto kCodeAttribute = std::string_view{"N"};
inline constexpr auto kUserMessageAttribute = std::string_view{"M"};
inline constexpr auto kDeveloperMessageAttribute = std::string_view{"D"};
inline constexpr auto kProcedureAttribute = std::string_view{"P"};
inline constexpr auto kLineAttribute = std::string_view{"L"};

/// Nesting depth beyond which decoding gives up.
inline constexpr auto kMaxDepth = std::size_t{256};

/// Append `value` to `out` escaped for use inside a double-quoted attribute.
void escape_attribute(std::string_view value, std::string& out);

/// Encode a childless element `<name a="1" .../>`.
std::string encode_element(std::string_view name,
                           const schema::attribute_list_t& attributes);

std::string encode(const schema::error_node& node);
void encode(const schema::error_node& node, std::string& out);
std::string encode(const schema::context_node& node);

/// True when the first non-blank character of `text` opens an element, which
/// is the marker of an encoded tree.
bool looks_encoded(std::string_view text);

/// Decode an encoded tree. Returns std::nullopt when `text` is not exactly
/// one well-formed "E" element (optionally surrounded by whitespace, an XML
/// declaration or comments).
std::optional<schema::error_node> try_decode(std::string_view text);

/// Decode the attributes of a single childless element named `name`, such as
/// `<TimeSpan Week="1"/>` or `<params a="1"/>`.
std::optional<schema::attribute_list_t> try_decode_element(
    std::string_view text,
    std::string_view name);

}  // namespace cascade::wire
