#pragma once

#include <cascade/catalog/catalog.hpp>
#include <cascade/schema/error_definition.hpp>
#include <cascade/schema/parameter.hpp>
#include <cascade/storage/rocksdb/storage.hpp>
#include <vector>

namespace cascade::catalog {

/// Owner of the error definitions of the audit purge job.
inline constexpr auto kMaintenanceProcedure =
    std::string_view{"MaintenanceUpdates"};

/// Error definitions every deployment starts with.
std::vector<schema::error_definition_t> default_error_definitions();

/// Runtime parameters every deployment starts with.
std::vector<schema::parameter_t> default_parameters();

/// Replace the stored error catalog with the defaults and merge the default
/// parameters: existing parameters keep their value and get the default
/// description, missing ones are inserted.
void seed(const storage::storage_t& store);

/// Load a catalog snapshot (definitions and procedure directory).
catalog load_catalog(const storage::storage_t& store);

}  // namespace cascade::catalog
