#include <gtest/gtest.h>
#include <cascade/audit/audit_log.hpp>
#include <cascade/testing/common.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace {

cascade::config::configuration make_configuration(const bool read,
                                                  const bool write) {
  return cascade::config::configuration{
      std::vector<cascade::schema::parameter_t>{
          {.name = "AuditReadLog", .value = read ? "true" : "false"},
          {.name = "AuditWriteLog", .value = write ? "1" : "0"}}};
}

cascade::schema::timestamp_milliseconds_t day_ms(
    const std::chrono::sys_days day) {
  return static_cast<cascade::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          day.time_since_epoch())
          .count());
}

}  // namespace

TEST(audit_log, disabled_flags_create_no_entries) {
  auto fixture = cascade::testing::store_fixture{"cascade_audit_disabled"};
  auto configuration = make_configuration(false, false);
  auto audit = cascade::audit::audit_log{fixture.storage(), configuration};

  EXPECT_FALSE(audit.begin("ArticleSave", false).has_value());
  EXPECT_FALSE(audit.begin("ArticleGet", true).has_value());
  EXPECT_TRUE(audit.list().empty());
}

TEST(audit_log, read_and_write_frames_use_separate_flags) {
  auto fixture = cascade::testing::store_fixture{"cascade_audit_flags"};
  auto configuration = make_configuration(false, true);
  auto audit = cascade::audit::audit_log{fixture.storage(), configuration};

  EXPECT_FALSE(audit.begin("ArticleGet", true).has_value());
  auto id = audit.begin("ArticleSave", false,
                        cascade::audit::make_params({{"ArticleId", "15"}}));
  ASSERT_TRUE(id.has_value());

  auto entry = audit.get(*id);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->procedure_name, "ArticleSave");
  EXPECT_EQ(entry->input_data, "<params ArticleId=\"15\"/>");
  EXPECT_GT(entry->start_time, 0u);
  EXPECT_FALSE(entry->end_time.has_value());
}

TEST(audit_log, ids_increase_across_instances) {
  auto fixture = cascade::testing::store_fixture{"cascade_audit_ids"};
  auto configuration = make_configuration(true, true);
  auto first = std::optional<cascade::schema::audit_id_t>{};
  auto second = std::optional<cascade::schema::audit_id_t>{};
  {
    auto audit = cascade::audit::audit_log{fixture.storage(), configuration};
    first = audit.begin("A", true);
    second = audit.begin("B", false);
  }
  auto audit = cascade::audit::audit_log{fixture.storage(), configuration};
  auto third = audit.begin("C", false);
  ASSERT_TRUE(first && second && third);
  EXPECT_LT(*first, *second);
  EXPECT_LT(*second, *third);
  EXPECT_EQ(fixture.storage().load_audit_sequence(), *third);
}

TEST(audit_log, interleaved_instances_share_the_sequence) {
  auto fixture = cascade::testing::store_fixture{"cascade_audit_interleaved"};
  auto configuration = make_configuration(true, true);
  auto refreshed = make_configuration(true, true);
  auto older = cascade::audit::audit_log{fixture.storage(), configuration};
  auto newer = cascade::audit::audit_log{fixture.storage(), refreshed};

  auto first = older.begin("ArticleSave", false);
  auto second = newer.begin("ArticleGet", true);
  auto third = older.begin("ArticleDelete", false);
  ASSERT_TRUE(first && second && third);
  EXPECT_NE(*first, *second);
  EXPECT_NE(*second, *third);
  EXPECT_NE(*first, *third);

  older.end(third);
  newer.fail(second, "<E N=\"1\" M=\"m\" P=\"p\"/>");
  auto entries = fixture.storage().list_audit_entries();
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0].procedure_name, "ArticleSave");
  EXPECT_FALSE(entries[0].end_time.has_value());
  EXPECT_EQ(entries[1].procedure_name, "ArticleGet");
  EXPECT_TRUE(entries[1].error_message.has_value());
  EXPECT_EQ(entries[2].procedure_name, "ArticleDelete");
  EXPECT_TRUE(entries[2].end_time.has_value());
}

TEST(audit_log, end_closes_entry_once) {
  auto fixture = cascade::testing::store_fixture{"cascade_audit_end"};
  auto configuration = make_configuration(true, true);
  auto audit = cascade::audit::audit_log{fixture.storage(), configuration};
  auto id = audit.begin("ArticleSave", false);
  ASSERT_TRUE(id.has_value());

  audit.end(id, "<result ArticleId=\"15\"/>");
  auto closed = audit.get(*id);
  ASSERT_TRUE(closed.has_value());
  ASSERT_TRUE(closed->end_time.has_value());
  EXPECT_EQ(closed->output_data, "<result ArticleId=\"15\"/>");

  audit.fail(id, "<E N=\"1\" M=\"late\" P=\"p\"/>");
  audit.end(id, "<result again=\"1\"/>");
  auto unchanged = audit.get(*id);
  ASSERT_TRUE(unchanged.has_value());
  EXPECT_EQ(unchanged->end_time, closed->end_time);
  EXPECT_EQ(unchanged->output_data, "<result ArticleId=\"15\"/>");
  EXPECT_FALSE(unchanged->error_message.has_value());
}

TEST(audit_log, fail_records_error_text) {
  auto fixture = cascade::testing::store_fixture{"cascade_audit_fail"};
  auto configuration = make_configuration(true, true);
  auto audit = cascade::audit::audit_log{fixture.storage(), configuration};
  auto id = audit.begin("ArticleSave", false);

  audit.fail(id, "<E N=\"1002\" M=\"dup\" P=\"ArticleSave\"/>");
  auto entry = audit.get(*id);
  ASSERT_TRUE(entry.has_value());
  EXPECT_TRUE(entry->end_time.has_value());
  EXPECT_EQ(entry->error_message, "<E N=\"1002\" M=\"dup\" P=\"ArticleSave\"/>");
  EXPECT_FALSE(entry->output_data.has_value());
}

TEST(audit_log, absent_id_is_a_no_op) {
  auto fixture = cascade::testing::store_fixture{"cascade_audit_absent"};
  auto configuration = make_configuration(true, true);
  auto audit = cascade::audit::audit_log{fixture.storage(), configuration};
  audit.end(std::nullopt, "out");
  audit.fail(std::nullopt, "err");
  audit.end(cascade::schema::audit_id_t{42});
  EXPECT_TRUE(audit.list().empty());
}

TEST(audit_log, purge_removes_expired_entries_in_batches) {
  using namespace std::chrono;
  auto fixture = cascade::testing::store_fixture{"cascade_audit_purge"};
  auto& store = fixture.storage();
  auto configuration = make_configuration(true, true);
  auto audit = cascade::audit::audit_log{store, configuration};

  auto now = day_ms(sys_days{year{2024} / March / 15}) + 5000;
  auto old_start = day_ms(sys_days{year{2024} / March / 1});
  auto old_end = day_ms(sys_days{year{2024} / March / 2});
  auto recent = day_ms(sys_days{year{2024} / March / 10});

  auto put = [&](const cascade::schema::audit_id_t id,
                 const cascade::schema::timestamp_milliseconds_t start,
                 const std::optional<cascade::schema::timestamp_milliseconds_t>
                     end) {
    store.put_audit_entry(cascade::schema::audit_entry_t{
        .audit_id = id,
        .procedure_name = "Proc",
        .start_time = start,
        .end_time = end});
  };
  put(1, old_start, old_end);
  put(2, old_start, std::nullopt);
  put(3, old_start, recent);
  put(4, recent, std::nullopt);
  put(5, old_start, old_end);

  EXPECT_EQ(audit.purge(now, 2), 2u);
  EXPECT_EQ(audit.purge(now), 1u);
  EXPECT_EQ(audit.purge(now), 0u);

  auto remaining = audit.list();
  ASSERT_EQ(remaining.size(), 2u);
  EXPECT_EQ(remaining[0].audit_id, 3u);
  EXPECT_EQ(remaining[1].audit_id, 4u);
}
