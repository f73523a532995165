#include "audit.h"

#include "../cli_context.h"

#include "mseq/app/json_views.h"
#include "mseq/app/sequence_service.h"
#include "shared/arg_parser.h"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct AuditCliConfig {
  mseq::cli::CliConfig common;  // NOLINT(readability-identifier-naming)
  bool list_traces{false};      // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_audit(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<mseq::apps::Option<AuditCliConfig>> options = {
      {"--list", false, "List known trace ids",
       [](AuditCliConfig& c, const std::string& /*v*/) {
         c.list_traces = true;
         return std::string();
       }},
  };
  mseq::cli::append_common_options(options);
  const std::string usage = "Usage: mseq_cli audit (--trace <id> | --list)\n" +
                            mseq::apps::format_option_help(options);

  const auto parsed = mseq::apps::parse_options(argc, argv, options, 2);
  if (mseq::cli::report_parse_errors(parsed.errors, usage)) {
    return 1;
  }
  const auto& config = parsed.config;

  if (!config.list_traces && !config.common.trace_id.has_value()) {
    std::cerr << "Error: pass --trace <id> or --list\n" << usage;
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
  auto& services = ctx_result.value()->services();

  nlohmann::json out = nlohmann::json::array();
  if (config.list_traces) {
    for (const auto& trace_id : services.audit_log.list_trace_ids()) {
      out.push_back(trace_id);
    }
  } else {
    for (const auto& event : mseq::app::fetch_audit_trace(*config.common.trace_id, services)) {
      out.push_back(mseq::app::to_json(event));
    }
  }
  std::cout << out.dump(2) << "\n";
  return 0;
}
