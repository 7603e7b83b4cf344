#include <gtest/gtest.h>
#include <cascade/common/failure.hpp>
#include <cascade/schema/key/store_keys.hpp>
#include <cascade/storage/rocksdb/storage.hpp>
#include <cascade/testing/common.hpp>

#include <string>
#include <vector>

namespace {

cascade::schema::error_definition_t make_definition(
    const cascade::schema::error_code_t id,
    std::string procedure,
    std::string name) {
  return cascade::schema::error_definition_t{
      .error_id = id,
      .procedure_name = std::move(procedure),
      .error_name = std::move(name),
      .user_message = "message " + std::to_string(id)};
}

}  // namespace

TEST(storage_keys, audit_keys_sort_numerically) {
  auto low = cascade::schema::key::make_audit_entry_key(2);
  auto high = cascade::schema::key::make_audit_entry_key(300);
  EXPECT_LT(cascade::schema::make_string(low),
            cascade::schema::make_string(high));
  EXPECT_EQ(cascade::schema::key::parse_audit_entry_key(
                cascade::schema::make_bytes_view(high)),
            300u);
  EXPECT_FALSE(cascade::schema::key::parse_audit_entry_key(
                   cascade::schema::make_bytes_view(
                       cascade::schema::key::make_parameter_key("DebugMode")))
                   .has_value());
}

TEST(storage_keys, error_definition_fields_do_not_run_together) {
  EXPECT_NE(cascade::schema::key::make_error_definition_key("ab", "c"),
            cascade::schema::key::make_error_definition_key("a", "bc"));
}

TEST(storage, error_definitions_round_trip) {
  auto fixture = cascade::testing::store_fixture{"cascade_storage_errors"};
  auto& store = fixture.storage();
  auto definition = make_definition(2021001, "ArticleIsDeletable",
                                    "ArticleNotFound");
  definition.developer_message = "Article #EntityId# not found.";
  store.put_error_definition(definition);

  auto definitions = store.list_error_definitions();
  ASSERT_EQ(definitions.size(), 1u);
  EXPECT_EQ(definitions[0].error_id, 2021001);
  EXPECT_EQ(definitions[0].procedure_name, "ArticleIsDeletable");
  EXPECT_EQ(definitions[0].error_name, "ArticleNotFound");
  EXPECT_EQ(definitions[0].developer_message, "Article #EntityId# not found.");
}

TEST(storage, duplicate_error_definitions_raise_index_violation) {
  auto fixture = cascade::testing::store_fixture{"cascade_storage_unique"};
  auto& store = fixture.storage();
  store.put_error_definition(make_definition(1, "Proc", "A"));

  try {
    store.put_error_definition(make_definition(2, "Proc", "A"));
    FAIL() << "duplicate (procedure, error name) accepted";
  } catch (const cascade::common::failure& e) {
    EXPECT_EQ(e.number(), cascade::common::kUniqueIndexViolation);
  }
  EXPECT_THROW(store.put_error_definition(make_definition(1, "Proc", "B")),
               cascade::common::failure);
  EXPECT_EQ(store.list_error_definitions().size(), 1u);
}

TEST(storage, replace_error_definitions_drops_previous_rows) {
  auto fixture = cascade::testing::store_fixture{"cascade_storage_replace"};
  auto& store = fixture.storage();
  store.put_error_definition(make_definition(1, "Old", "A"));
  store.replace_error_definitions(
      {make_definition(10, "New", "A"), make_definition(11, "New", "B")});

  auto definitions = store.list_error_definitions();
  ASSERT_EQ(definitions.size(), 2u);
  for (const auto& definition : definitions) {
    EXPECT_EQ(definition.procedure_name, "New");
  }

  EXPECT_THROW(store.replace_error_definitions({make_definition(20, "X", "A"),
                                                make_definition(20, "X", "B")}),
               cascade::common::failure);
  EXPECT_EQ(store.list_error_definitions().size(), 2u);
}

TEST(storage, procedures_get_stable_ids) {
  auto fixture = cascade::testing::store_fixture{"cascade_storage_procedures"};
  auto& store = fixture.storage();
  auto first = store.register_procedure("ArticleIsDeletable");
  auto second = store.register_procedure("MaintenanceUpdates");
  EXPECT_NE(first, second);
  EXPECT_EQ(store.register_procedure("ArticleIsDeletable"), first);

  auto procedures = store.list_procedures();
  ASSERT_EQ(procedures.size(), 2u);
  EXPECT_EQ(procedures.at(first), "ArticleIsDeletable");
  EXPECT_EQ(procedures.at(second), "MaintenanceUpdates");
}

TEST(storage, parameters_round_trip) {
  auto fixture = cascade::testing::store_fixture{"cascade_storage_parameters"};
  auto& store = fixture.storage();
  EXPECT_FALSE(store.get_parameter("DebugMode").has_value());

  store.put_parameter(cascade::schema::parameter_t{
      .name = "DebugMode", .value = "true", .description = "debug"});
  store.put_parameter(
      cascade::schema::parameter_t{.name = "AuditReadLog", .value = std::nullopt});

  auto debug = store.get_parameter("DebugMode");
  ASSERT_TRUE(debug.has_value());
  EXPECT_EQ(debug->value, "true");
  EXPECT_EQ(debug->description, "debug");
  EXPECT_EQ(store.list_parameters().size(), 2u);
}

TEST(storage, audit_entries_and_sequence) {
  auto fixture = cascade::testing::store_fixture{"cascade_storage_audit"};
  auto& store = fixture.storage();
  EXPECT_FALSE(store.load_audit_sequence().has_value());

  for (const auto id : {300u, 2u, 1u}) {
    store.put_audit_entry(
        cascade::schema::audit_entry_t{.audit_id = id,
                                       .procedure_name = "Proc",
                                       .start_time = 1000 + id},
        id == 300u ? std::optional<cascade::schema::audit_id_t>{300}
                   : std::nullopt);
  }
  EXPECT_EQ(store.load_audit_sequence(), 300u);

  auto entries = store.list_audit_entries();
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0].audit_id, 1u);
  EXPECT_EQ(entries[1].audit_id, 2u);
  EXPECT_EQ(entries[2].audit_id, 300u);

  store.remove_audit_entries({1, 300});
  entries = store.list_audit_entries();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].audit_id, 2u);
  EXPECT_FALSE(store.get_audit_entry(1).has_value());
  ASSERT_TRUE(store.get_audit_entry(2).has_value());
  EXPECT_EQ(store.get_audit_entry(2)->start_time, 1002u);
}
