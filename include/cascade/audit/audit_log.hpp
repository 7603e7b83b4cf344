#pragma once

#include <cascade/config/configuration.hpp>
#include <cascade/schema/audit_entry.hpp>
#include <cascade/schema/primitives.hpp>
#include <cascade/storage/rocksdb/storage.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cascade::audit {

inline constexpr auto kParamsElement = std::string_view{"params"};
inline constexpr auto kDefaultPurgeBatch = std::size_t{100};

/// Encode frame inputs as `<params a="1" .../>`.
std::string make_params(const schema::attribute_list_t& attributes);

/// Start of the UTC day of `now` moved back by `period`.
schema::timestamp_milliseconds_t purge_cutoff(
    schema::timestamp_milliseconds_t now,
    const config::purge_period& period);

/// Invocation trail of frames.
///
/// Entries are created only when the configuration enables auditing for the
/// kind of frame. An entry is closed exactly once, by end() or by fail();
/// later updates of a closed entry are logged and ignored.
class audit_log final {
 public:
  audit_log(const storage::storage_t& store,
            const config::configuration& configuration);

  /// Open an entry for `procedure_name`. Read-only frames are gated by
  /// AuditReadLog, the others by AuditWriteLog. Returns the new id, or
  /// std::nullopt when auditing is disabled.
  std::optional<schema::audit_id_t> begin(
      std::string_view procedure_name,
      bool read_only,
      std::optional<std::string> input_data = std::nullopt);

  /// Close an entry on normal completion. No-op for an absent id.
  void end(std::optional<schema::audit_id_t> audit_id,
           std::optional<std::string> output_data = std::nullopt);

  /// Close an entry with the encoded failure. No-op for an absent id.
  void fail(std::optional<schema::audit_id_t> audit_id,
            std::string error_message);

  std::optional<schema::audit_entry_t> get(schema::audit_id_t audit_id) const;
  std::vector<schema::audit_entry_t> list() const;

  /// Delete at most `batch` entries that started before the retention cutoff
  /// and are either still open or ended before it. Returns the number
  /// deleted.
  std::size_t purge(schema::timestamp_milliseconds_t now,
                    std::size_t batch = kDefaultPurgeBatch);

  const config::configuration& configuration() const { return configuration_; }

 private:
  void close(std::optional<schema::audit_id_t> audit_id,
             std::optional<std::string> output_data,
             std::optional<std::string> error_message);

  const storage::storage_t& store_;
  const config::configuration& configuration_;
};

}  // namespace cascade::audit
