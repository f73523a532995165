#include "redis_health.h"

#include "../cli_context.h"

#include "mseq/counter/redis_config.h"
#include "mseq/counter/redis_health.h"
#include "shared/arg_parser.h"

#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace {

struct RedisHealthCliConfig {
  std::optional<std::string> redis_uri;  // NOLINT(readability-identifier-naming)
  std::string key_namespace{mseq::counter::kDefaultKeyNamespace};  // NOLINT(readability-identifier-naming)
};

}  // namespace

// redis-health checks that the counter backend answers and reports how many
// sequence configs it holds. It never writes.
int cmd_redis_health(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<mseq::apps::Option<RedisHealthCliConfig>> options = {
      {"--redis", true, "Counter backend URI (tcp://host[:port] or redis://host[:port][/db])",
       [](RedisHealthCliConfig& c, const std::string& v) {
         c.redis_uri = v;
         return std::string();
       }},
      {"--namespace", true, "Key namespace of the counter store (default mseq)",
       [](RedisHealthCliConfig& c, const std::string& v) {
         if (v.empty()) {
           return std::string("Invalid --namespace: must not be empty");
         }
         c.key_namespace = v;
         return std::string();
       }},
  };
  const std::string usage = "Usage: mseq_cli redis-health --redis <uri> [--namespace <ns>]\n" +
                            mseq::apps::format_option_help(options);

  const auto parsed = mseq::apps::parse_options(argc, argv, options, 2);
  if (mseq::cli::report_parse_errors(parsed.errors, usage)) {
    return 1;
  }
  const auto& config = parsed.config;

  if (!config.redis_uri.has_value()) {
    std::cerr << "Error: --redis <uri> is required\n" << usage;
    return 1;
  }
  const auto redis_config = mseq::counter::parse_redis_uri(*config.redis_uri);
  if (!redis_config.has_value()) {
    std::cerr << "Error: invalid Redis URI '" << *config.redis_uri << "'\n";
    return 1;
  }

  const auto status = mseq::counter::probe_counter_backend(*redis_config, config.key_namespace);

  nlohmann::json out;
  out["target"] = mseq::counter::redis_config_to_log_string(*redis_config);
  out["namespace"] = config.key_namespace;
  out["reachable"] = status.reachable;
  if (status.reachable) {
    out["sequence_configs"] = status.config_count;
    std::cout << out.dump(2) << "\n";
    return 0;
  }
  out["error"] = status.error;
  std::cerr << out.dump(2) << "\n";
  return 1;
}
