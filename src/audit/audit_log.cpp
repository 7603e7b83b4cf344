#include <cascade/audit/audit_log.hpp>
#include <cascade/wire/codec.hpp>

#include <spdlog/spdlog.h>
#include <chrono>
#include <mutex>

namespace cascade::audit {

std::string make_params(const schema::attribute_list_t& attributes) {
  return wire::encode_element(kParamsElement, attributes);
}

schema::timestamp_milliseconds_t purge_cutoff(
    const schema::timestamp_milliseconds_t now,
    const config::purge_period& period) {
  using namespace std::chrono;
  auto day = floor<days>(sys_time<milliseconds>{milliseconds{now}});
  auto date = year_month_day{day} - months{period.months};
  if (!date.ok()) {
    date = year_month_day{date.year() / date.month() / last};
  }
  auto cutoff = sys_days{date} - weeks{period.weeks} - days{period.days};
  auto since_epoch = duration_cast<milliseconds>(cutoff.time_since_epoch());
  if (since_epoch.count() < 0) {
    return 0;
  }
  return static_cast<schema::timestamp_milliseconds_t>(since_epoch.count());
}

audit_log::audit_log(const storage::storage_t& store,
                     const config::configuration& configuration)
    : store_(store), configuration_(configuration) {}

std::optional<schema::audit_id_t> audit_log::begin(
    const std::string_view procedure_name,
    const bool read_only,
    std::optional<std::string> input_data) {
  auto flag = read_only ? config::kAuditReadLogKey : config::kAuditWriteLogKey;
  if (!configuration_.enabled(flag)) {
    return std::nullopt;
  }

  auto entry = schema::audit_entry_t{
      .procedure_name = std::string{procedure_name},
      .input_data = std::move(input_data),
      .start_time = schema::now_milliseconds()};
  auto lock = std::scoped_lock{*store_.audit_mutex};
  store_.append_audit_entry(entry);
  spdlog::debug("Opened audit entry {} for {}", entry.audit_id,
                procedure_name);
  return entry.audit_id;
}

void audit_log::end(const std::optional<schema::audit_id_t> audit_id,
                    std::optional<std::string> output_data) {
  close(audit_id, std::move(output_data), std::nullopt);
}

void audit_log::fail(const std::optional<schema::audit_id_t> audit_id,
                     std::string error_message) {
  close(audit_id, std::nullopt, std::move(error_message));
}

void audit_log::close(const std::optional<schema::audit_id_t> audit_id,
                      std::optional<std::string> output_data,
                      std::optional<std::string> error_message) {
  if (!audit_id) {
    return;
  }
  auto lock = std::scoped_lock{*store_.audit_mutex};
  auto entry = store_.get_audit_entry(*audit_id);
  if (!entry) {
    spdlog::warn("Audit entry {} does not exist", *audit_id);
    return;
  }
  if (entry->end_time) {
    spdlog::warn("Audit entry {} of {} is already closed", *audit_id,
                 entry->procedure_name);
    return;
  }
  entry->end_time = schema::now_milliseconds();
  if (output_data) {
    entry->output_data = std::move(output_data);
  }
  if (error_message) {
    entry->error_message = std::move(error_message);
  }
  store_.put_audit_entry(*entry);
}

std::optional<schema::audit_entry_t> audit_log::get(
    const schema::audit_id_t audit_id) const {
  return store_.get_audit_entry(audit_id);
}

std::vector<schema::audit_entry_t> audit_log::list() const {
  return store_.list_audit_entries();
}

std::size_t audit_log::purge(const schema::timestamp_milliseconds_t now,
                             const std::size_t batch) {
  auto cutoff = purge_cutoff(now, configuration_.retention());
  auto lock = std::scoped_lock{*store_.audit_mutex};
  auto expired = std::vector<schema::audit_id_t>{};
  for (const auto& entry : store_.list_audit_entries()) {
    if (expired.size() >= batch) {
      break;
    }
    if (entry.start_time < cutoff &&
        (!entry.end_time || *entry.end_time < cutoff)) {
      expired.push_back(entry.audit_id);
    }
  }
  store_.remove_audit_entries(expired);
  spdlog::info("Purged {} audit entr{} older than {}", expired.size(),
               expired.size() == 1 ? "y" : "ies", cutoff);
  return expired.size();
}

}  // namespace cascade::audit
