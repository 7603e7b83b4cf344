#include <gtest/gtest.h>
#include <cascade/testing/common.hpp>
#include <cascade/wire/codec.hpp>

#include <string>
#include <variant>

namespace {

cascade::schema::error_node make_branch_error() {
  auto node = cascade::testing::make_leaf(
      2021003, "The Branch specified was not found", "ArticleIsDeletable",
      "Branch 15 not found or deleted.");
  node.source_line = 103;
  return node;
}

}  // namespace

TEST(wire_codec, encodes_childless_error_as_empty_element) {
  EXPECT_EQ(cascade::wire::encode(make_branch_error()),
            "<E N=\"2021003\" M=\"The Branch specified was not found\" "
            "D=\"Branch 15 not found or deleted.\" P=\"ArticleIsDeletable\" "
            "L=\"103\"/>");
}

TEST(wire_codec, encodes_children_in_order) {
  auto node = cascade::testing::make_leaf(1, "a", "p");
  node.children.emplace_back(cascade::testing::make_context(
      {{"EntityId", "15"}, {"EntityType", "2"}}));
  node.children.emplace_back(cascade::testing::make_leaf(2, "b", "q"));

  EXPECT_EQ(cascade::wire::encode(node),
            "<E N=\"1\" M=\"a\" P=\"p\"><T EntityId=\"15\" EntityType=\"2\"/>"
            "<E N=\"2\" M=\"b\" P=\"q\"/></E>");
}

TEST(wire_codec, escapes_attribute_values) {
  auto node = cascade::testing::make_leaf(1, "a<b & \"c\"\n\tz", "p");
  auto encoded = cascade::wire::encode(node);
  EXPECT_EQ(encoded,
            "<E N=\"1\" M=\"a&lt;b &amp; &quot;c&quot;&#xA;&#x9;z\" "
            "P=\"p\"/>");

  auto decoded = cascade::wire::try_decode(encoded);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->user_message, "a<b & \"c\"\n\tz");
}

TEST(wire_codec, decode_is_lenient_about_layout) {
  auto decoded = cascade::wire::try_decode(
      "<?xml version=\"1.0\"?>\n<!-- captured -->\n"
      "<E P='Outer' N=\"5\" M=\"x &amp; y &#65;\">\n"
      "  <T a=\"1\"/>\n"
      "</E>\n");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->code, 5);
  EXPECT_EQ(decoded->user_message, "x & y A");
  EXPECT_EQ(decoded->source_procedure, "Outer");
  EXPECT_FALSE(decoded->developer_message.has_value());
  EXPECT_FALSE(decoded->source_line.has_value());
  ASSERT_EQ(decoded->children.size(), 1u);
  EXPECT_EQ(std::get<cascade::schema::context_node>(decoded->children[0]),
            cascade::testing::make_context({{"a", "1"}}));
}

TEST(wire_codec, literal_line_breaks_in_attributes_read_as_spaces) {
  auto decoded =
      cascade::wire::try_decode("<E N=\"1\" M=\"a\nb\" P=\"p\"/>");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->user_message, "a b");
}

TEST(wire_codec, rejects_text_that_is_not_an_error_tree) {
  EXPECT_FALSE(cascade::wire::try_decode("plain failure text").has_value());
  EXPECT_FALSE(cascade::wire::try_decode("").has_value());
  EXPECT_FALSE(
      cascade::wire::try_decode("<X N=\"1\" M=\"m\" P=\"p\"/>").has_value());
  EXPECT_FALSE(
      cascade::wire::try_decode("<E N=\"x\" M=\"m\" P=\"p\"/>").has_value());
  EXPECT_FALSE(cascade::wire::try_decode("<E N=\"1\" M=\"m\"/>").has_value());
  EXPECT_FALSE(
      cascade::wire::try_decode("<E N=\"1\" M=\"m\" P=\"p\" L=\"x\"/>")
          .has_value());
  EXPECT_FALSE(cascade::wire::try_decode(
                   "<E N=\"1\" M=\"m\" P=\"p\"/><E N=\"2\" M=\"m\" P=\"p\"/>")
                   .has_value());
  EXPECT_FALSE(
      cascade::wire::try_decode("<E N=\"1\" M=\"m\" P=\"p\"></T>").has_value());
  EXPECT_FALSE(
      cascade::wire::try_decode("<E N=\"1\" M=\"m\" P=\"p\">text</E>")
          .has_value());
  EXPECT_FALSE(
      cascade::wire::try_decode("<E N=\"1\" N=\"2\" M=\"m\" P=\"p\"/>")
          .has_value());
  EXPECT_FALSE(
      cascade::wire::try_decode("<E N=\"1\" M=\"m\" P=\"p\">").has_value());
}

TEST(wire_codec, keeps_unknown_elements_as_attachments) {
  auto text = std::string{
      "<E N=\"1\" M=\"m\" P=\"p\"><Extra k=\"v\"><inner/></Extra></E>"};
  auto decoded = cascade::wire::try_decode(text);
  ASSERT_TRUE(decoded.has_value());
  ASSERT_EQ(decoded->children.size(), 1u);
  const auto& attachment =
      std::get<cascade::schema::attachment_node>(decoded->children[0]);
  EXPECT_EQ(attachment.name, "Extra");
  EXPECT_EQ(attachment.content, "<inner/>");
  EXPECT_EQ(cascade::wire::encode(*decoded), text);
}

TEST(wire_codec, nested_tree_survives_encoding) {
  auto inner = make_branch_error();
  inner.children.emplace_back(cascade::testing::make_context(
      {{"EntityId", "15"}, {"Note", "a & b < c"}}));

  auto root = cascade::testing::make_leaf(50001, "Outer failed: ", "Outer",
                                          "Outer failed: details");
  root.source_line = 9;
  root.children.emplace_back(
      cascade::testing::make_context({{"ThrownBy", "Inner"}}));
  root.children.emplace_back(inner);
  root.children.emplace_back(cascade::schema::attachment_node{
      .name = "Trace", .attributes = {{"depth", "2"}}});
  root.children.emplace_back(
      cascade::testing::make_context({{"CalledBy", "Main"}, {"Line", "4"}}));

  auto decoded = cascade::wire::try_decode(cascade::wire::encode(root));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, root);
}

TEST(wire_codec, looks_encoded_checks_first_visible_character) {
  EXPECT_TRUE(cascade::wire::looks_encoded("  \n<E/>"));
  EXPECT_FALSE(cascade::wire::looks_encoded("E <E/>"));
  EXPECT_FALSE(cascade::wire::looks_encoded("   "));
}

TEST(wire_codec, decodes_single_childless_element) {
  auto attributes = cascade::wire::try_decode_element(
      "<TimeSpan Month=\"0\" Week=\"1\" Day=\"0\" />", "TimeSpan");
  ASSERT_TRUE(attributes.has_value());
  EXPECT_EQ(*attributes, (cascade::schema::attribute_list_t{
                             {"Month", "0"}, {"Week", "1"}, {"Day", "0"}}));

  EXPECT_FALSE(
      cascade::wire::try_decode_element("<TimeSpan Week=\"1\"/>", "params")
          .has_value());
  EXPECT_FALSE(cascade::wire::try_decode_element(
                   "<TimeSpan><Week/></TimeSpan>", "TimeSpan")
                   .has_value());
}

TEST(wire_codec, encode_element_writes_params) {
  EXPECT_EQ(cascade::wire::encode_element(
                "params", {{"ArticleId", "15"}, {"Name", "A \"b\""}}),
            "<params ArticleId=\"15\" Name=\"A &quot;b&quot;\"/>");
}

TEST(wire_codec, rejects_excessive_nesting) {
  auto text = std::string{};
  for (auto i = 0; i < 300; ++i) {
    text += "<E N=\"1\" M=\"m\" P=\"p\">";
  }
  for (auto i = 0; i < 300; ++i) {
    text += "</E>";
  }
  EXPECT_FALSE(cascade::wire::try_decode(text).has_value());
}
