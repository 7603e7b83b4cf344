#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <cascade/audit/audit_log.hpp>
#include <cascade/catalog/defaults.hpp>
#include <cascade/catalog/lookup.hpp>
#include <cascade/common/failure.hpp>
#include <cascade/config/configuration.hpp>
#include <cascade/execution/error_handler.hpp>
#include <cascade/execution/frame.hpp>
#include <cascade/storage/rocksdb/storage.hpp>
#include <cascade/wire/codec.hpp>
#include <cascade/wire/truncation.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace {

void print_tree(const cascade::schema::error_node& node, std::size_t depth) {
  auto indent = std::string(depth * 2, ' ');
  std::cout << indent << node.code << " " << node.source_procedure;
  if (node.source_line) {
    std::cout << "[" << *node.source_line << "]";
  }
  std::cout << ": " << node.user_message << "\n";
  if (node.developer_message) {
    std::cout << indent << "  developer: " << *node.developer_message << "\n";
  }
  for (const auto& child : node.children) {
    std::visit(
        overloaded{
            [&](const cascade::schema::context_node& context) {
              std::cout << indent << "  context:";
              for (const auto& [name, value] : context.attributes) {
                std::cout << " " << name << "=" << value;
              }
              std::cout << "\n";
            },
            [&](const cascade::schema::attachment_node& attachment) {
              std::cout << indent << "  attachment: " << attachment.name
                        << "\n";
            },
            [&](const cascade::schema::error_node& nested) {
              print_tree(nested, depth + 1);
            }},
        child);
  }
}

void set_parameter(const cascade::storage::storage_t& store,
                   const std::string& assignment) {
  auto separator = assignment.find('=');
  if (separator == std::string::npos || separator == 0) {
    spdlog::error("Expected NAME=VALUE, got '{}'", assignment);
    return;
  }
  auto name = assignment.substr(0, separator);
  auto parameter = store.get_parameter(name).value_or(
      cascade::schema::parameter_t{.name = name});
  parameter.value = assignment.substr(separator + 1);
  store.put_parameter(parameter);
  spdlog::info("Parameter {} set to '{}'", name, *parameter.value);
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::info);

  auto db_path = std::string{};
  auto log_path = std::string{};
  auto budget = std::size_t{};
  auto assignments = std::vector<std::string>{};
  auto render_text = std::string{};
  auto fit_text = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Cascade"};
  description.add_options()("help,h", "Show the help message")(
      "db,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "cascade.db"),
      "RocksDB path of the catalog, configuration and audit stores")(
      "log-file",
      boost::program_options::value<std::string>(&log_path)->default_value(
          "cascade.log"),
      "Log file")("seed", "Install the default error catalog and parameters")(
      "set-parameter",
      boost::program_options::value<std::vector<std::string>>(&assignments)
          ->composing(),
      "Set a runtime parameter, NAME=VALUE")(
      "purge", "Delete audit entries older than the purge period")(
      "list-audit", "Print the audit entries")(
      "render", boost::program_options::value<std::string>(&render_text),
      "Print an encoded error as a tree")(
      "fit", boost::program_options::value<std::string>(&fit_text),
      "Truncate an encoded error to the budget")(
      "budget",
      boost::program_options::value<std::size_t>(&budget)->default_value(
          cascade::wire::kDefaultBudget),
      "Length budget of signaled messages")("verbose,v",
                                            "Enable verbose output");
  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    std::cerr << e.what() << "\n" << description << std::endl;
    return 2;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "cascade", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  auto exit_code = 0;
  if (vm.contains("render") || vm.contains("fit")) {
    auto text = vm.contains("render") ? render_text : fit_text;
    auto node = cascade::wire::try_decode(text);
    if (!node) {
      spdlog::error("Input is not an encoded error");
      spdlog::shutdown();
      return 1;
    }
    if (vm.contains("render")) {
      print_tree(*node, 0);
    } else {
      std::cout << cascade::wire::fit(*node, budget) << std::endl;
    }
    spdlog::shutdown();
    return 0;
  }

  auto store = cascade::storage::make_storage<
      cascade::storage::rocksdb_storage_tag>(db_path);

  if (vm.contains("seed")) {
    cascade::catalog::seed(store);
  }
  for (const auto& assignment : assignments) {
    set_parameter(store, assignment);
  }

  if (vm.contains("purge")) {
    store.register_procedure(cascade::catalog::kMaintenanceProcedure);
    auto errors = cascade::catalog::load_catalog(store);
    auto configuration = cascade::config::load_configuration(store);
    auto audit = cascade::audit::audit_log{store, configuration};
    auto handler = cascade::execution::error_handler{
        errors, configuration, &audit,
        cascade::execution::handler_options{.budget = budget}};
    auto transactions = cascade::execution::transaction_context{};
    try {
      auto maintenance = cascade::execution::frame{
          handler, transactions,
          std::string{cascade::catalog::kMaintenanceProcedure}};
      auto purged = maintenance.run([&](cascade::execution::frame&) {
        return audit.purge(cascade::schema::now_milliseconds());
      });
      std::cout << "Purged " << purged << " audit entries" << std::endl;
    } catch (const cascade::common::failure& e) {
      spdlog::error("Purge failed: {}", e.what());
      exit_code = 1;
    }
  }

  if (vm.contains("list-audit")) {
    for (const auto& entry : store.list_audit_entries()) {
      std::cout << entry.audit_id << "\t" << entry.procedure_name << "\t"
                << entry.start_time << "\t"
                << (entry.end_time ? std::to_string(*entry.end_time) : "-")
                << "\t" << entry.error_message.value_or("") << std::endl;
    }
  }

  spdlog::shutdown();
  return exit_code;
}
