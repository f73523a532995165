#include "swap_format.h"

#include "../cli_context.h"

#include "mseq/app/json_views.h"
#include "mseq/app/sequence_service.h"
#include "shared/arg_parser.h"

#include <iostream>
#include <string>
#include <vector>

namespace {

struct SwapFormatCliConfig {
  mseq::cli::CliConfig common;  // NOLINT(readability-identifier-naming)
  bool preview{false};          // NOLINT(readability-identifier-naming)
};

}  // namespace

// swap-format rewrites every stored template that renders {category} before
// {sequence} so that the sequence comes first. Counters are left untouched.
int cmd_swap_format(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<mseq::apps::Option<SwapFormatCliConfig>> options = {
      {"--preview", false, "Report the rewritten templates without storing them",
       [](SwapFormatCliConfig& c, const std::string& /*v*/) {
         c.preview = true;
         return std::string();
       }},
  };
  mseq::cli::append_common_options(options);
  const std::string usage =
      "Usage: mseq_cli swap-format [--preview]\n" + mseq::apps::format_option_help(options);

  const auto parsed = mseq::apps::parse_options(argc, argv, options, 2);
  if (mseq::cli::report_parse_errors(parsed.errors, usage)) {
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

  const auto response = mseq::app::run_format_swap(
      {config.preview, config.common.actor, config.common.trace_id}, ctx.services(), ctx.id_gen(),
      ctx.clock());
  mseq::cli::warn_audit_dropped(response.trace_id, response.audit_dropped);
  mseq::cli::print_success(response.trace_id, mseq::app::to_json(response.report));
  return response.report.failed == 0 ? 0 : 1;
}
