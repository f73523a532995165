#include "config.h"

#include "../cli_context.h"

#include "mseq/app/json_views.h"
#include "mseq/app/sequence_service.h"
#include "shared/arg_parser.h"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct ConfigCliConfig {
  mseq::cli::CliConfig common;             // NOLINT(readability-identifier-naming)
  std::optional<std::string> id;           // NOLINT(readability-identifier-naming)
  std::optional<std::string> category;     // NOLINT(readability-identifier-naming)
  std::optional<std::string> subcategory;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> prefix;       // NOLINT(readability-identifier-naming)
  std::optional<std::string> format;       // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> start;       // NOLINT(readability-identifier-naming)
  std::optional<bool> active;              // NOLINT(readability-identifier-naming)
  bool reformat{false};                    // NOLINT(readability-identifier-naming)
};

std::vector<mseq::apps::Option<ConfigCliConfig>> config_options() {
  std::vector<mseq::apps::Option<ConfigCliConfig>> options = {
      {"--id", true, "Sequence config id",
       [](ConfigCliConfig& c, const std::string& v) {
         c.id = v;
         return std::string();
       }},
      {"--category", true, "Category id of the scope",
       [](ConfigCliConfig& c, const std::string& v) {
         c.category = v;
         return std::string();
       }},
      {"--subcategory", true, "Subcategory id of the scope (omit for category-wide)",
       [](ConfigCliConfig& c, const std::string& v) {
         c.subcategory = v;
         return std::string();
       }},
      {"--prefix", true, "Identifier prefix, 1-10 chars of [A-Z0-9-]",
       [](ConfigCliConfig& c, const std::string& v) {
         c.prefix = v;
         return std::string();
       }},
      {"--format", true, "Identifier template, e.g. {category}-{subcategory}-{sequence}",
       [](ConfigCliConfig& c, const std::string& v) {
         c.format = v;
         return std::string();
       }},
      {"--start", true, "Starting number (>= 1)",
       [](ConfigCliConfig& c, const std::string& v) {
         c.start = mseq::cli::parse_int64(v);
         return c.start.has_value() ? std::string() : "Invalid --start: " + v;
       }},
      {"--active", true, "Activate or deactivate the counter (true|false)",
       [](ConfigCliConfig& c, const std::string& v) {
         if (v == "true") {
           c.active = true;
         } else if (v == "false") {
           c.active = false;
         } else {
           return "Invalid --active: " + v + " (valid: true, false)";
         }
         return std::string();
       }},
      {"--reformat", false, "On update, re-render existing identifiers when the format changes",
       [](ConfigCliConfig& c, const std::string& /*v*/) {
         c.reformat = true;
         return std::string();
       }},
  };
  mseq::cli::append_common_options(options);
  return options;
}

std::string usage(const std::vector<mseq::apps::Option<ConfigCliConfig>>& options) {
  return "Usage: mseq_cli config <create|update|reset|delete|get|show|list> [options]\n"
         "  create  --category [--subcategory] --prefix --format [--start]\n"
         "  update  --id [--prefix] [--format] [--start] [--active] [--reformat]\n"
         "  reset   --id --start\n"
         "  delete  --id\n"
         "  get     --id\n"
         "  show    --category [--subcategory]   exact scope, no fallback\n" +
         mseq::apps::format_option_help(options);
}

std::optional<mseq::domain::SequenceScope> scope_from(const ConfigCliConfig& config) {
  if (!config.category.has_value()) {
    return std::nullopt;
  }
  mseq::domain::SequenceScope scope{mseq::core::CategoryId{*config.category}, std::nullopt};
  if (config.subcategory.has_value()) {
    scope.subcategory_id = mseq::core::CategoryId{*config.subcategory};
  }
  return scope;
}

int create_config(const ConfigCliConfig& config, mseq::cli::CliContext& ctx) {
  const auto scope = scope_from(config);
  if (!scope || !config.prefix || !config.format) {
    std::cerr << "Error: config create requires --category, --prefix and --format\n";
    return 1;
  }

  mseq::app::CreateConfigCommand cmd{
      {*scope, *config.prefix, *config.format, config.start.value_or(1), config.common.actor},
      config.common.trace_id};
  const auto traced = mseq::app::run_create_config(cmd, ctx.services(), ctx.id_gen(), ctx.clock());
  mseq::cli::warn_audit_dropped(traced.trace_id, traced.audit_dropped);
  if (!traced.result.has_value()) {
    return mseq::cli::print_failure(traced.trace_id, traced.result.error());
  }
  return mseq::cli::print_success(traced.trace_id, mseq::app::to_json(traced.result.value()));
}

int update_config(const ConfigCliConfig& config, mseq::cli::CliContext& ctx) {
  if (!config.id) {
    std::cerr << "Error: config update requires --id\n";
    return 1;
  }

  mseq::app::UpdateConfigCommand cmd{
      mseq::core::ConfigId{*config.id},
      {config.prefix, config.format, config.start, config.active, config.common.actor},
      config.reformat,
      config.common.trace_id};
  const auto traced = mseq::app::run_update_config(cmd, ctx.services(), ctx.id_gen(), ctx.clock());
  mseq::cli::warn_audit_dropped(traced.trace_id, traced.audit_dropped);
  if (!traced.result.has_value()) {
    return mseq::cli::print_failure(traced.trace_id, traced.result.error());
  }

  const auto& outcome = traced.result.value();
  nlohmann::json result;
  result["config"] = mseq::app::to_json(outcome.change.after);
  result["template_changed"] = outcome.change.template_changed();
  result["counter_reset"] = outcome.change.counter_reset();
  result["reformat"] = outcome.reformat.has_value() ? mseq::app::to_json(*outcome.reformat)
                                                    : nlohmann::json(nullptr);
  result["reformat_error"] = outcome.reformat_error.has_value()
                                 ? mseq::app::to_json(*outcome.reformat_error)
                                 : nlohmann::json(nullptr);
  mseq::cli::print_success(traced.trace_id, result);
  return outcome.reformat_error.has_value() ? 1 : 0;
}

int reset_config(const ConfigCliConfig& config, mseq::cli::CliContext& ctx) {
  if (!config.id || !config.start) {
    std::cerr << "Error: config reset requires --id and --start\n";
    return 1;
  }

  mseq::app::ResetSequenceCommand cmd{mseq::core::ConfigId{*config.id}, *config.start,
                                      config.common.actor, config.common.trace_id};
  const auto traced =
      mseq::app::run_reset_sequence(cmd, ctx.services(), ctx.id_gen(), ctx.clock());
  mseq::cli::warn_audit_dropped(traced.trace_id, traced.audit_dropped);
  if (!traced.result.has_value()) {
    return mseq::cli::print_failure(traced.trace_id, traced.result.error());
  }
  return mseq::cli::print_success(traced.trace_id, mseq::app::to_json(traced.result.value()));
}

int delete_config(const ConfigCliConfig& config, mseq::cli::CliContext& ctx) {
  if (!config.id) {
    std::cerr << "Error: config delete requires --id\n";
    return 1;
  }

  mseq::app::DeleteConfigCommand cmd{mseq::core::ConfigId{*config.id}, config.common.actor,
                                     config.common.trace_id};
  const auto traced = mseq::app::run_delete_config(cmd, ctx.services(), ctx.id_gen(), ctx.clock());
  mseq::cli::warn_audit_dropped(traced.trace_id, traced.audit_dropped);
  if (!traced.result.has_value()) {
    return mseq::cli::print_failure(traced.trace_id, traced.result.error());
  }
  return mseq::cli::print_success(traced.trace_id, mseq::app::to_json(traced.result.value()));
}

int print_optional_config(const std::optional<mseq::domain::SequenceConfig>& found,
                          const std::string& what) {
  if (!found.has_value()) {
    std::cerr << "Error: no sequence config for " << what << "\n";
    return 1;
  }
  std::cout << mseq::app::to_json(*found).dump(2) << "\n";
  return 0;
}

}  // namespace

int cmd_config(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = config_options();
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

  if (action == "create") {
    return create_config(config, ctx);
  }
  if (action == "update") {
    return update_config(config, ctx);
  }
  if (action == "reset") {
    return reset_config(config, ctx);
  }
  if (action == "delete") {
    return delete_config(config, ctx);
  }
  if (action == "get") {
    if (!config.id) {
      std::cerr << "Error: config get requires --id\n";
      return 1;
    }
    return print_optional_config(ctx.services().configs.get(mseq::core::ConfigId{*config.id}),
                                 *config.id);
  }
  if (action == "show") {
    const auto scope = scope_from(config);
    if (!scope) {
      std::cerr << "Error: config show requires --category\n";
      return 1;
    }
    return print_optional_config(ctx.services().configs.find_exact(*scope),
                                 mseq::domain::scope_to_string(*scope));
  }
  if (action == "list") {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& cfg : ctx.services().configs.list_all()) {
      out.push_back(mseq::app::to_json(cfg));
    }
    std::cout << out.dump(2) << "\n";
    return 0;
  }

  std::cerr << "Unknown config action: " << action << "\n" << usage(options);
  return 1;
}
