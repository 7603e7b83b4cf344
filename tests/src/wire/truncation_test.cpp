#include <gtest/gtest.h>
#include <cascade/testing/common.hpp>
#include <cascade/wire/codec.hpp>
#include <cascade/wire/truncation.hpp>

#include <string>
#include <variant>

namespace {

// Root with one of every kind of child:
//   T(ctx), E(child, with nested E(grandchild)), attachment.
cascade::schema::error_node make_tree() {
  auto grandchild = cascade::testing::make_leaf(3, "grandchild", "Leaf");
  auto child = cascade::testing::make_leaf(2, "child", "Middle");
  child.children.emplace_back(grandchild);

  auto root =
      cascade::testing::make_leaf(1, "root", "Outer", "root developer text");
  root.children.emplace_back(
      cascade::testing::make_context({{"CalledBy", "Main"}}));
  root.children.emplace_back(child);
  root.children.emplace_back(
      cascade::schema::attachment_node{.name = "Trace"});
  return root;
}

}  // namespace

TEST(wire_truncation, reductions_follow_priority_order) {
  auto step1 = cascade::wire::reduce(make_tree());
  ASSERT_TRUE(step1.has_value());
  ASSERT_EQ(step1->children.size(), 2u);
  EXPECT_TRUE(std::holds_alternative<cascade::schema::error_node>(
      step1->children.back()));

  auto step2 = cascade::wire::reduce(*step1);
  ASSERT_TRUE(step2.has_value());
  ASSERT_EQ(step2->children.size(), 2u);
  ASSERT_NE(step2->last_error(), nullptr);
  EXPECT_TRUE(step2->last_error()->children.empty());

  auto step3 = cascade::wire::reduce(*step2);
  ASSERT_TRUE(step3.has_value());
  ASSERT_EQ(step3->children.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<cascade::schema::context_node>(
      step3->children.front()));

  auto step4 = cascade::wire::reduce(*step3);
  ASSERT_TRUE(step4.has_value());
  EXPECT_TRUE(step4->children.empty());
  EXPECT_TRUE(step4->developer_message.has_value());

  auto step5 = cascade::wire::reduce(*step4);
  ASSERT_TRUE(step5.has_value());
  EXPECT_FALSE(step5->developer_message.has_value());

  EXPECT_FALSE(cascade::wire::reduce(*step5).has_value());

  EXPECT_EQ(step5->code, 1);
  EXPECT_EQ(step5->user_message, "root");
  EXPECT_EQ(step5->source_procedure, "Outer");
}

TEST(wire_truncation, reduce_leaves_input_untouched) {
  auto tree = make_tree();
  auto copy = tree;
  auto reduced = cascade::wire::reduce(tree);
  ASSERT_TRUE(reduced.has_value());
  EXPECT_EQ(tree, copy);
  EXPECT_NE(*reduced, tree);
}

TEST(wire_truncation, fitting_tree_is_encoded_unchanged) {
  auto tree = make_tree();
  EXPECT_EQ(cascade::wire::fit(tree), cascade::wire::encode(tree));
}

TEST(wire_truncation, stops_at_first_reduction_that_fits) {
  auto tree = make_tree();
  auto without_attachment = *cascade::wire::reduce(tree);
  auto expected = cascade::wire::encode(without_attachment);

  EXPECT_EQ(cascade::wire::fit(tree, expected.size()), expected);

  auto without_grandchild = *cascade::wire::reduce(without_attachment);
  EXPECT_EQ(cascade::wire::fit(tree, expected.size() - 1),
            cascade::wire::encode(without_grandchild));
}

TEST(wire_truncation, irreducible_root_is_emitted_oversized) {
  auto root = cascade::testing::make_leaf(7, std::string(3000, 'x'), "Outer",
                                          "developer");
  root.children.emplace_back(
      cascade::testing::make_context({{"ThrownBy", "Inner"}}));

  auto fitted = cascade::wire::fit(root);
  auto expected = cascade::testing::make_leaf(7, std::string(3000, 'x'), "Outer");
  EXPECT_EQ(fitted, cascade::wire::encode(expected));
  EXPECT_GT(fitted.size(), cascade::wire::kDefaultBudget);
}

TEST(wire_truncation, unlimited_fit_keeps_everything) {
  auto tree = make_tree();
  EXPECT_EQ(cascade::wire::fit(tree, 10, false), cascade::wire::encode(tree));
}

TEST(wire_truncation, fit_is_idempotent) {
  auto tree = make_tree();
  for (auto i = 0; i < 40; ++i) {
    tree.children.emplace_back(cascade::testing::make_context(
        {{"Index", std::to_string(i)}, {"Payload", std::string(60, 'p')}}));
  }
  auto once = cascade::wire::fit(tree);
  ASSERT_LE(once.size(), cascade::wire::kDefaultBudget);

  auto decoded = cascade::wire::try_decode(once);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(cascade::wire::fit(*decoded), once);
}

TEST(wire_truncation, character_count_ignores_continuation_bytes) {
  EXPECT_EQ(cascade::wire::character_count(""), 0u);
  EXPECT_EQ(cascade::wire::character_count("abc"), 3u);
  EXPECT_EQ(cascade::wire::character_count("\xC3\xA9t\xC3\xA9"), 3u);
  EXPECT_EQ(cascade::wire::character_count("\xE2\x82\xAC"), 1u);
}

TEST(wire_truncation, budget_counts_characters_not_bytes) {
  auto root = cascade::testing::make_leaf(1, "root", "Outer");
  auto accented = std::string{};
  for (auto i = 0; i < 20; ++i) {
    accented.append("\xC3\xA9");
  }
  root.children.emplace_back(
      cascade::testing::make_context({{"Name", accented}}));

  auto encoded = cascade::wire::encode(root);
  auto characters = cascade::wire::character_count(encoded);
  ASSERT_EQ(encoded.size(), characters + 20);

  EXPECT_EQ(cascade::wire::fit(root, characters), encoded);
  auto reduced = cascade::wire::fit(root, characters - 1);
  EXPECT_EQ(reduced.find("Name="), std::string::npos);
}
