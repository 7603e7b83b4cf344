#include <cascade/wire/codec.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace cascade::wire {

namespace {

struct raw_element final {
  std::string name;
  schema::attribute_list_t attributes;
  std::vector<raw_element> children;
  bool has_text{false};
  std::string_view content;
};

bool is_space(const char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_name_start(const char c) {
  auto uc = static_cast<unsigned char>(c);
  return std::isalpha(uc) != 0 || c == '_' || c == ':' || uc >= 0x80;
}

bool is_name_char(const char c) {
  return is_name_start(c) || std::isdigit(static_cast<unsigned char>(c)) != 0 ||
         c == '-' || c == '.';
}

bool append_utf8(const uint32_t code_point, std::string& out) {
  if (code_point == 0 || code_point > 0x10FFFF ||
      (code_point >= 0xD800 && code_point <= 0xDFFF)) {
    return false;
  }
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6u)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3Fu)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12u)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6u) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3Fu)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18u)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12u) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6u) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3Fu)));
  }
  return true;
}

template <typename T>
std::optional<T> parse_integer(const std::string_view text) {
  auto value = T{};
  auto [end, error] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (error != std::errc{} || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

class reader final {
 public:
  explicit reader(const std::string_view text) : text_{text} {}

  bool at_end() const { return pos_ >= text_.size(); }

  /// Skip whitespace, comments and processing instructions.
  bool skip_misc() {
    while (true) {
      skip_spaces();
      if (starts_with("<?")) {
        if (!skip_past("?>")) {
          return false;
        }
      } else if (starts_with("<!--")) {
        if (!skip_past("-->")) {
          return false;
        }
      } else {
        return true;
      }
    }
  }

  std::optional<raw_element> parse_element(const std::size_t depth) {
    if (depth > kMaxDepth || !consume('<')) {
      return std::nullopt;
    }
    auto element = raw_element{};
    auto name = parse_name();
    if (!name) {
      return std::nullopt;
    }
    element.name = std::move(*name);

    while (true) {
      auto had_space = skip_spaces();
      if (starts_with("/>")) {
        pos_ += 2;
        return element;
      }
      if (consume('>')) {
        break;
      }
      if (!had_space) {
        return std::nullopt;
      }
      auto attribute_name = parse_name();
      if (!attribute_name) {
        return std::nullopt;
      }
      skip_spaces();
      if (!consume('=')) {
        return std::nullopt;
      }
      skip_spaces();
      auto value = parse_attribute_value();
      if (!value) {
        return std::nullopt;
      }
      if (schema::find_attribute(element.attributes, *attribute_name) !=
          nullptr) {
        return std::nullopt;
      }
      element.attributes.emplace_back(std::move(*attribute_name),
                                      std::move(*value));
    }

    auto content_begin = pos_;
    while (!at_end()) {
      if (starts_with("</")) {
        auto content_end = pos_;
        pos_ += 2;
        auto end_name = parse_name();
        if (!end_name || *end_name != element.name) {
          return std::nullopt;
        }
        skip_spaces();
        if (!consume('>')) {
          return std::nullopt;
        }
        element.content =
            text_.substr(content_begin, content_end - content_begin);
        return element;
      }
      if (starts_with("<!--")) {
        if (!skip_past("-->")) {
          return std::nullopt;
        }
      } else if (starts_with("<![CDATA[")) {
        pos_ += 9;
        auto end = text_.find("]]>", pos_);
        if (end == std::string_view::npos) {
          return std::nullopt;
        }
        auto cdata = text_.substr(pos_, end - pos_);
        if (std::any_of(std::begin(cdata), std::end(cdata),
                        [](const char c) { return !is_space(c); })) {
          element.has_text = true;
        }
        pos_ = end + 3;
      } else if (starts_with("<?")) {
        if (!skip_past("?>")) {
          return std::nullopt;
        }
      } else if (text_[pos_] == '<') {
        auto child = parse_element(depth + 1);
        if (!child) {
          return std::nullopt;
        }
        element.children.push_back(std::move(*child));
      } else if (text_[pos_] == '&') {
        auto ignored = std::string{};
        if (!parse_reference(ignored)) {
          return std::nullopt;
        }
        element.has_text = true;
      } else {
        if (!is_space(text_[pos_])) {
          element.has_text = true;
        }
        ++pos_;
      }
    }
    return std::nullopt;
  }

 private:
  bool starts_with(const std::string_view prefix) const {
    return text_.substr(pos_).starts_with(prefix);
  }

  bool consume(const char c) {
    if (at_end() || text_[pos_] != c) {
      return false;
    }
    ++pos_;
    return true;
  }

  bool skip_spaces() {
    auto start = pos_;
    while (!at_end() && is_space(text_[pos_])) {
      ++pos_;
    }
    return pos_ != start;
  }

  bool skip_past(const std::string_view terminator) {
    auto end = text_.find(terminator, pos_);
    if (end == std::string_view::npos) {
      return false;
    }
    pos_ = end + terminator.size();
    return true;
  }

  std::optional<std::string> parse_name() {
    if (at_end() || !is_name_start(text_[pos_])) {
      return std::nullopt;
    }
    auto start = pos_;
    while (!at_end() && is_name_char(text_[pos_])) {
      ++pos_;
    }
    return std::string{text_.substr(start, pos_ - start)};
  }

  std::optional<std::string> parse_attribute_value() {
    if (at_end() || (text_[pos_] != '"' && text_[pos_] != '\'')) {
      return std::nullopt;
    }
    auto quote = text_[pos_++];
    auto value = std::string{};
    while (!at_end()) {
      auto c = text_[pos_];
      if (c == quote) {
        ++pos_;
        return value;
      }
      if (c == '<') {
        return std::nullopt;
      }
      if (c == '&') {
        if (!parse_reference(value)) {
          return std::nullopt;
        }
        continue;
      }
      // Attribute value normalization: literal line breaks and tabs read as
      // spaces; the encoder writes them as character references.
      value.push_back(is_space(c) ? ' ' : c);
      ++pos_;
    }
    return std::nullopt;
  }

  bool parse_reference(std::string& out) {
    auto end = text_.find(';', pos_);
    if (end == std::string_view::npos || end - pos_ > 12) {
      return false;
    }
    auto entity = text_.substr(pos_ + 1, end - pos_ - 1);
    pos_ = end + 1;
    if (entity == "amp") {
      out.push_back('&');
    } else if (entity == "lt") {
      out.push_back('<');
    } else if (entity == "gt") {
      out.push_back('>');
    } else if (entity == "quot") {
      out.push_back('"');
    } else if (entity == "apos") {
      out.push_back('\'');
    } else if (entity.starts_with("#x") || entity.starts_with("#X")) {
      auto code_point = uint32_t{};
      auto digits = entity.substr(2);
      auto [ptr, error] = std::from_chars(
          digits.data(), digits.data() + digits.size(), code_point, 16);
      if (digits.empty() || error != std::errc{} ||
          ptr != digits.data() + digits.size()) {
        return false;
      }
      return append_utf8(code_point, out);
    } else if (entity.starts_with("#")) {
      auto code_point = parse_integer<uint32_t>(entity.substr(1));
      if (!code_point) {
        return false;
      }
      return append_utf8(*code_point, out);
    } else {
      return false;
    }
    return true;
  }

  std::string_view text_;
  std::size_t pos_{};
};

std::optional<raw_element> parse_document(const std::string_view text) {
  auto input = reader{text};
  if (!input.skip_misc()) {
    return std::nullopt;
  }
  auto root = input.parse_element(0);
  if (!root || !input.skip_misc() || !input.at_end()) {
    return std::nullopt;
  }
  return root;
}

std::optional<schema::error_node> to_error_node(const raw_element& element) {
  if (element.name != kErrorElement || element.has_text) {
    return std::nullopt;
  }
  auto node = schema::error_node{};
  auto has_code = false;
  auto has_user_message = false;
  auto has_procedure = false;
  for (const auto& [name, value] : element.attributes) {
    if (name == kCodeAttribute) {
      auto code = parse_integer<schema::error_code_t>(value);
      if (!code) {
        return std::nullopt;
      }
      node.code = *code;
      has_code = true;
    } else if (name == kUserMessageAttribute) {
      node.user_message = value;
      has_user_message = true;
    } else if (name == kDeveloperMessageAttribute) {
      node.developer_message = value;
    } else if (name == kProcedureAttribute) {
      node.source_procedure = value;
      has_procedure = true;
    } else if (name == kLineAttribute) {
      auto line = parse_integer<int32_t>(value);
      if (!line) {
        return std::nullopt;
      }
      node.source_line = *line;
    }
  }
  if (!has_code || !has_user_message || !has_procedure) {
    return std::nullopt;
  }

  node.children.reserve(element.children.size());
  for (const auto& child : element.children) {
    if (child.name == kContextElement) {
      if (!child.children.empty() || child.has_text) {
        return std::nullopt;
      }
      node.children.emplace_back(schema::context_node{child.attributes});
    } else if (child.name == kErrorElement) {
      auto nested = to_error_node(child);
      if (!nested) {
        return std::nullopt;
      }
      node.children.emplace_back(std::move(*nested));
    } else {
      node.children.emplace_back(schema::attachment_node{
          child.name, child.attributes, std::string{child.content}});
    }
  }
  return node;
}

void encode_attribute(const std::string_view name,
                      const std::string_view value,
                      std::string& out) {
  out.push_back(' ');
  out.append(name);
  out.append("=\"");
  escape_attribute(value, out);
  out.push_back('"');
}

void encode_attributes(const schema::attribute_list_t& attributes,
                       std::string& out) {
  for (const auto& [name, value] : attributes) {
    encode_attribute(name, value, out);
  }
}

void encode_child(const schema::node_child_t& child, std::string& out) {
  std::visit(overloaded{[&](const schema::context_node& context) {
                          out.push_back('<');
                          out.append(kContextElement);
                          encode_attributes(context.attributes, out);
                          out.append("/>");
                        },
                        [&](const schema::attachment_node& attachment) {
                          out.push_back('<');
                          out.append(attachment.name);
                          encode_attributes(attachment.attributes, out);
                          if (attachment.content.empty()) {
                            out.append("/>");
                            return;
                          }
                          out.push_back('>');
                          out.append(attachment.content);
                          out.append("</");
                          out.append(attachment.name);
                          out.push_back('>');
                        },
                        [&](const schema::error_node& nested) {
                          encode(nested, out);
                        }},
             child);
}

}  // namespace

void escape_attribute(const std::string_view value, std::string& out) {
  for (const auto c : value) {
    switch (c) {
      case '&':
        out.append("&amp;");
        break;
      case '<':
        out.append("&lt;");
        break;
      case '>':
        out.append("&gt;");
        break;
      case '"':
        out.append("&quot;");
        break;
      case '\t':
        out.append("&#x9;");
        break;
      case '\n':
        out.append("&#xA;");
        break;
      case '\r':
        out.append("&#xD;");
        break;
      default:
        out.push_back(c);
    }
  }
}

std::string encode_element(const std::string_view name,
                           const schema::attribute_list_t& attributes) {
  auto out = std::string{"<"};
  out.append(name);
  encode_attributes(attributes, out);
  out.append("/>");
  return out;
}

std::string encode(const schema::error_node& node) {
  auto out = std::string{};
  encode(node, out);
  return out;
}

void encode(const schema::error_node& node, std::string& out) {
  out.push_back('<');
  out.append(kErrorElement);
  encode_attribute(kCodeAttribute, std::to_string(node.code), out);
  encode_attribute(kUserMessageAttribute, node.user_message, out);
  if (node.developer_message) {
    encode_attribute(kDeveloperMessageAttribute, *node.developer_message, out);
  }
  encode_attribute(kProcedureAttribute, node.source_procedure, out);
  if (node.source_line) {
    encode_attribute(kLineAttribute, std::to_string(*node.source_line), out);
  }
  if (node.children.empty()) {
    out.append("/>");
    return;
  }
  out.push_back('>');
  for (const auto& child : node.children) {
    encode_child(child, out);
  }
  out.append("</");
  out.append(kErrorElement);
  out.push_back('>');
}

std::string encode(const schema::context_node& node) {
  return encode_element(kContextElement, node.attributes);
}

bool looks_encoded(const std::string_view text) {
  auto first = std::find_if(std::begin(text), std::end(text),
                            [](const char c) { return !is_space(c); });
  return first != std::end(text) && *first == '<';
}

std::optional<schema::error_node> try_decode(const std::string_view text) {
  if (!looks_encoded(text)) {
    return std::nullopt;
  }
  auto root = parse_document(text);
  if (!root) {
    return std::nullopt;
  }
  return to_error_node(*root);
}

std::optional<schema::attribute_list_t> try_decode_element(
    const std::string_view text,
    const std::string_view name) {
  auto root = parse_document(text);
  if (!root || root->name != name || !root->children.empty() ||
      root->has_text) {
    return std::nullopt;
  }
  return root->attributes;
}

}  // namespace cascade::wire
