#include "generate.h"

#include "../cli_context.h"

#include "mseq/app/json_views.h"
#include "mseq/app/sequence_service.h"
#include "shared/arg_parser.h"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct GenerateCliConfig {
  mseq::cli::CliConfig common;             // NOLINT(readability-identifier-naming)
  std::optional<std::string> category;     // NOLINT(readability-identifier-naming)
  std::optional<std::string> subcategory;  // NOLINT(readability-identifier-naming)
  int count{1};                            // NOLINT(readability-identifier-naming)
};

}  // namespace

// generate issues identifiers for a scope without binding them to a machine.
// With --count N it issues N identifiers in order under one trace.
int cmd_generate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<mseq::apps::Option<GenerateCliConfig>> options = {
      {"--category", true, "Category id",
       [](GenerateCliConfig& c, const std::string& v) {
         c.category = v;
         return std::string();
       }},
      {"--subcategory", true, "Subcategory id (falls back to the category-wide counter)",
       [](GenerateCliConfig& c, const std::string& v) {
         c.subcategory = v;
         return std::string();
       }},
      {"--count", true, "Number of identifiers to issue (default 1)",
       [](GenerateCliConfig& c, const std::string& v) {
         const auto n = mseq::cli::parse_int64(v);
         if (!n.has_value() || *n < 1 || *n > 10000) {
           return "Invalid --count: " + v + " (1-10000)";
         }
         c.count = static_cast<int>(*n);
         return std::string();
       }},
  };
  mseq::cli::append_common_options(options);
  const std::string usage =
      "Usage: mseq_cli generate --category <id> [--subcategory <id>] [--count N]\n" +
      mseq::apps::format_option_help(options);

  const auto parsed = mseq::apps::parse_options(argc, argv, options, 2);
  if (mseq::cli::report_parse_errors(parsed.errors, usage)) {
    return 1;
  }
  const auto& config = parsed.config;

  if (!config.category.has_value()) {
    std::cerr << "Error: --category <id> is required\n" << usage;
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

  // Every identifier in one invocation shares a trace id.
  const std::string trace_id =
      config.common.trace_id.value_or(mseq::core::new_trace_id(ctx.id_gen()).value);

  nlohmann::json issued = nlohmann::json::array();
  for (int i = 0; i < config.count; ++i) {
    const auto traced = mseq::app::run_generate_identifier({scope, trace_id}, ctx.services(),
                                                           ctx.id_gen(), ctx.clock());
    mseq::cli::warn_audit_dropped(traced.trace_id, traced.audit_dropped);
    if (!traced.result.has_value()) {
      if (!issued.empty()) {
        std::cout << issued.dump(2) << "\n";
      }
      return mseq::cli::print_failure(traced.trace_id, traced.result.error());
    }
    issued.push_back(mseq::app::to_json(traced.result.value()));
  }

  return mseq::cli::print_success(trace_id, config.count == 1 ? issued.at(0) : issued);
}
