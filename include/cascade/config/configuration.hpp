#pragma once

#include <cascade/schema/parameter.hpp>
#include <cascade/schema/primitives.hpp>
#include <cascade/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cascade::config {

inline constexpr auto kAuditReadLogKey = std::string_view{"AuditReadLog"};
inline constexpr auto kAuditWriteLogKey = std::string_view{"AuditWriteLog"};
inline constexpr auto kDebugModeKey = std::string_view{"DebugMode"};
inline constexpr auto kPurgePeriodKey = std::string_view{"PurgePeriod"};

/// Truthy values start with 'y', 't' or '1', in any case. Missing values are
/// false.
bool is_truthy(std::optional<std::string_view> value);

/// Retention window of the audit purge, `<TimeSpan Month="0" Week="1"
/// Day="0"/>` in the configuration store.
struct purge_period final {
  int32_t months{0};
  int32_t weeks{1};
  int32_t days{0};
};

/// Parse a TimeSpan element. Missing attributes count as zero; text that is
/// not a TimeSpan element yields the default period of one week.
purge_period parse_purge_period(std::string_view text);

/// Immutable snapshot of the runtime parameters.
class configuration final {
 public:
  configuration() = default;
  explicit configuration(std::vector<schema::parameter_t> parameters);

  /// Parameter value, or std::nullopt when the parameter is missing or null.
  std::optional<std::string> value(std::string_view name) const;
  /// is_truthy() of the parameter value.
  bool enabled(std::string_view name) const;
  purge_period retention() const;

  const std::map<std::string, schema::parameter_t, std::less<>>& parameters()
      const {
    return parameters_;
  }

 private:
  std::map<std::string, schema::parameter_t, std::less<>> parameters_;
};

configuration load_configuration(const storage::storage_t& store);

}  // namespace cascade::config
