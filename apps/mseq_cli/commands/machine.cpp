#include "machine.h"

#include "../cli_context.h"

#include "mseq/app/json_views.h"
#include "mseq/app/sequence_service.h"
#include "shared/arg_parser.h"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct MachineCliConfig {
  mseq::cli::CliConfig common;             // NOLINT(readability-identifier-naming)
  std::optional<std::string> id;           // NOLINT(readability-identifier-naming)
  std::optional<std::string> name;         // NOLINT(readability-identifier-naming)
  std::optional<std::string> category;     // NOLINT(readability-identifier-naming)
  std::optional<std::string> subcategory;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> identifier;   // NOLINT(readability-identifier-naming)
  bool include_deleted{false};             // NOLINT(readability-identifier-naming)
};

std::vector<mseq::apps::Option<MachineCliConfig>> machine_options() {
  std::vector<mseq::apps::Option<MachineCliConfig>> options = {
      {"--id", true, "Machine id (generated on add when absent)",
       [](MachineCliConfig& c, const std::string& v) {
         c.id = v;
         return std::string();
       }},
      {"--name", true, "Machine name",
       [](MachineCliConfig& c, const std::string& v) {
         c.name = v;
         return std::string();
       }},
      {"--category", true, "Category id",
       [](MachineCliConfig& c, const std::string& v) {
         c.category = v;
         return std::string();
       }},
      {"--subcategory", true, "Subcategory id",
       [](MachineCliConfig& c, const std::string& v) {
         c.subcategory = v;
         return std::string();
       }},
      {"--identifier", true, "Existing machine_sequence to record on add",
       [](MachineCliConfig& c, const std::string& v) {
         c.identifier = v;
         return std::string();
       }},
      {"--include-deleted", false, "List soft-deleted machines too",
       [](MachineCliConfig& c, const std::string& /*v*/) {
         c.include_deleted = true;
         return std::string();
       }},
  };
  mseq::cli::append_common_options(options);
  return options;
}

std::string usage(const std::vector<mseq::apps::Option<MachineCliConfig>>& options) {
  return "Usage: mseq_cli machine <add|list|assign|delete> [options]\n"
         "  add     register a machine (category must exist)\n"
         "  assign  allocate the next identifier for --id and store it\n"
         "  delete  soft-delete --id; its identifier no longer blocks reuse\n" +
         mseq::apps::format_option_help(options);
}

int add_machine(const MachineCliConfig& config, mseq::cli::CliContext& ctx) {
  if (!config.name || !config.category) {
    std::cerr << "Error: machine add requires --name and --category\n";
    return 1;
  }
  auto& services = ctx.services();

  const mseq::core::CategoryId category_id{*config.category};
  if (!services.categories.get(category_id).has_value()) {
    std::cerr << "Error: category not found: " << *config.category << "\n";
    return 1;
  }
  std::optional<mseq::core::CategoryId> subcategory_id;
  if (config.subcategory.has_value()) {
    const auto sub = services.categories.get(mseq::core::CategoryId{*config.subcategory});
    if (!sub.has_value() || sub->parent_id != category_id) {
      std::cerr << "Error: subcategory " << *config.subcategory << " not found under "
                << *config.category << "\n";
      return 1;
    }
    subcategory_id = sub->category_id;
  }

  mseq::domain::Machine machine{
      config.id.has_value() ? mseq::core::MachineId{*config.id}
                          : mseq::core::new_machine_id(ctx.id_gen()),
      *config.name,
      category_id,
      subcategory_id,
      config.identifier.value_or(""),
      std::nullopt};
  if (!services.machines.upsert(machine).has_value()) {
    std::cerr << "Error: failed to store machine " << machine.machine_id.value << "\n";
    return 1;
  }
  std::cout << mseq::app::to_json(machine).dump(2) << "\n";
  return 0;
}

int list_machines(const MachineCliConfig& config, mseq::cli::CliContext& ctx) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& machine : ctx.services().machines.list_all()) {
    if (machine.is_live() || config.include_deleted) {
      out.push_back(mseq::app::to_json(machine));
    }
  }
  std::cout << out.dump(2) << "\n";
  return 0;
}

int assign_identifier(const MachineCliConfig& config, mseq::cli::CliContext& ctx) {
  if (!config.id) {
    std::cerr << "Error: machine assign requires --id\n";
    return 1;
  }
  const auto traced = mseq::app::run_assign_identifier(
      {mseq::core::MachineId{*config.id}, config.common.trace_id}, ctx.services(), ctx.id_gen(),
      ctx.clock());
  mseq::cli::warn_audit_dropped(traced.trace_id, traced.audit_dropped);
  if (!traced.result.has_value()) {
    return mseq::cli::print_failure(traced.trace_id, traced.result.error());
  }
  return mseq::cli::print_success(traced.trace_id, mseq::app::to_json(traced.result.value()));
}

int delete_machine(const MachineCliConfig& config, mseq::cli::CliContext& ctx) {
  if (!config.id) {
    std::cerr << "Error: machine delete requires --id\n";
    return 1;
  }
  const auto result = ctx.services().machines.soft_delete(mseq::core::MachineId{*config.id},
                                                          ctx.clock().now_iso8601());
  if (!result.has_value()) {
    std::cerr << "Error: machine not found or not writable: " << *config.id << "\n";
    return 1;
  }
  std::cout << "Deleted machine " << *config.id << "\n";
  return 0;
}

}  // namespace

int cmd_machine(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = machine_options();
  if (argc < 3) {
    std::cerr << usage(options);
    return 1;
  }
  const std::string action = argv[2];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  const auto parsed = mseq::apps::parse_options(argc, argv, options, 3);
  if (mseq::cli::report_parse_errors(parsed.errors, usage(options))) {
    return 1;
  }
  const auto& config = parsed.config;

  if (const auto error = mseq::cli::validate_cli_config(config.common); !error.empty()) {
    std::cerr << error << "\n";
    return 1;
  }

  auto ctx_result = mseq::cli::CliContext::open(config.common);
  if (!ctx_result.has_value()) {
    std::cerr << "Error: " << ctx_result.error() << "\n";
    return 1;
  }
  auto& ctx = *ctx_result.value();

  if (action == "add") {
    return add_machine(config, ctx);
  }
  if (action == "list") {
    return list_machines(config, ctx);
  }
  if (action == "assign") {
    return assign_identifier(config, ctx);
  }
  if (action == "delete") {
    return delete_machine(config, ctx);
  }

  std::cerr << "Unknown machine action: " << action << "\n" << usage(options);
  return 1;
}
