#include "reformat.h"

#include "../cli_context.h"

#include "mseq/app/json_views.h"
#include "mseq/app/sequence_service.h"
#include "shared/arg_parser.h"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct ReformatCliConfig {
  mseq::cli::CliConfig common;             // NOLINT(readability-identifier-naming)
  std::optional<std::string> category;     // NOLINT(readability-identifier-naming)
  std::optional<std::string> subcategory;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> old_format;   // NOLINT(readability-identifier-naming)
  std::optional<std::string> new_format;   // NOLINT(readability-identifier-naming)
  bool dry_run{false};                     // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_reformat(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<mseq::apps::Option<ReformatCliConfig>> options = {
      {"--category", true, "Category id of the scope",
       [](ReformatCliConfig& c, const std::string& v) {
         c.category = v;
         return std::string();
       }},
      {"--subcategory", true, "Subcategory id of the scope",
       [](ReformatCliConfig& c, const std::string& v) {
         c.subcategory = v;
         return std::string();
       }},
      {"--old-format", true, "Template the existing identifiers were rendered with",
       [](ReformatCliConfig& c, const std::string& v) {
         c.old_format = v;
         return std::string();
       }},
      {"--new-format", true, "Template to re-render identifiers with",
       [](ReformatCliConfig& c, const std::string& v) {
         c.new_format = v;
         return std::string();
       }},
      {"--dry-run", false, "Report planned changes without writing",
       [](ReformatCliConfig& c, const std::string& /*v*/) {
         c.dry_run = true;
         return std::string();
       }},
  };
  mseq::cli::append_common_options(options);
  const std::string usage =
      "Usage: mseq_cli reformat --category <id> [--subcategory <id>] --old-format <t> "
      "--new-format <t> [--dry-run]\n" +
      mseq::apps::format_option_help(options);

  const auto parsed = mseq::apps::parse_options(argc, argv, options, 2);
  if (mseq::cli::report_parse_errors(parsed.errors, usage)) {
    return 1;
  }
  const auto& config = parsed.config;

  if (!config.category || !config.old_format || !config.new_format) {
    std::cerr << "Error: --category, --old-format and --new-format are required\n" << usage;
    return 1;
  }
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

  mseq::domain::SequenceScope scope{mseq::core::CategoryId{*config.category}, std::nullopt};
  if (config.subcategory.has_value()) {
    scope.subcategory_id = mseq::core::CategoryId{*config.subcategory};
  }

  mseq::app::ReformatCommand cmd{{scope, *config.old_format, *config.new_format, config.dry_run},
                                 config.common.actor,
                                 config.common.trace_id};
  const auto traced = mseq::app::run_reformat(cmd, ctx.services(), ctx.id_gen(), ctx.clock());
  mseq::cli::warn_audit_dropped(traced.trace_id, traced.audit_dropped);
  if (!traced.result.has_value()) {
    return mseq::cli::print_failure(traced.trace_id, traced.result.error());
  }

  const auto& report = traced.result.value();
  mseq::cli::print_success(traced.trace_id, mseq::app::to_json(report));
  return report.failed == 0 ? 0 : 1;
}
