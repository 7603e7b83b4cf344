#pragma once

#include <cascade/catalog/catalog.hpp>
#include <cascade/catalog/defaults.hpp>
#include <cascade/schema/error_definition.hpp>
#include <cascade/schema/error_node.hpp>
#include <cascade/storage/rocksdb/storage.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace cascade::testing {

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Error definitions of the sample procedures used across the suites.
inline std::vector<cascade::schema::error_definition_t>
make_sample_definitions() {
  auto definitions = cascade::catalog::default_error_definitions();
  definitions.push_back(cascade::schema::error_definition_t{
      .error_id = 2021001,
      .procedure_name = "ArticleIsDeletable",
      .error_name = "ArticleNotFound",
      .user_message = "The Article #EntityId# specified was not found",
      .developer_message = "Article #EntityId# not found or deleted."});
  definitions.push_back(cascade::schema::error_definition_t{
      .error_id = 2021002,
      .procedure_name = "ArticleIsDeletable",
      .error_name = "ArticleLocked",
      .user_message = "The Article is locked. #ChildMessage#",
      .developer_message = "Lock check failed: #ChildMessage#"});
  definitions.push_back(cascade::schema::error_definition_t{
      .error_id = 2021003,
      .procedure_name = "ArticleIsDeletable",
      .error_name = "BranchNotFound",
      .user_message = "The Branch specified was not found"});
  return definitions;
}

inline cascade::catalog::catalog make_sample_catalog(
    std::map<cascade::schema::procedure_id_t, std::string> procedures = {
        {7, "ArticleIsDeletable"}}) {
  return cascade::catalog::catalog{make_sample_definitions(),
                                   std::move(procedures)};
}

inline cascade::schema::context_node make_context(
    cascade::schema::attribute_list_t attributes) {
  return cascade::schema::context_node{std::move(attributes)};
}

inline cascade::schema::error_node make_leaf(
    const cascade::schema::error_code_t code,
    std::string user_message,
    std::string procedure,
    std::optional<std::string> developer_message = std::nullopt) {
  return cascade::schema::error_node{
      .code = code,
      .user_message = std::move(user_message),
      .developer_message = std::move(developer_message),
      .source_procedure = std::move(procedure)};
}

/// RocksDB-backed store in a temporary directory, removed on destruction.
class store_fixture final {
 public:
  explicit store_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)},
        storage_{cascade::storage::make_storage<
            cascade::storage::rocksdb_storage_tag>(db_path_)} {}

  store_fixture(const store_fixture&) = delete;
  store_fixture& operator=(const store_fixture&) = delete;
  store_fixture(store_fixture&&) = delete;
  store_fixture& operator=(store_fixture&&) = delete;

  ~store_fixture() {
    storage_.database.reset();
    remove_path(db_path_);
  }

  const std::string& db_path() const { return db_path_; }
  cascade::storage::storage_t& storage() { return storage_; }
  const cascade::storage::storage_t& storage() const { return storage_; }

 private:
  std::string db_path_;
  cascade::storage::storage_t storage_;
};

}  // namespace cascade::testing
