#pragma once

#include "shared/arg_parser.h"

#include <optional>
#include <string>
#include <vector>

namespace mseq::cli {

enum class CounterBackend {
  kSqlite,  // NOLINT(readability-identifier-naming)
  kRedis,   // NOLINT(readability-identifier-naming)
};

// CliConfig holds the flags every subcommand accepts.
// Every field has an explicit default; optional fields mean "not configured".
struct CliConfig {
  std::string db_path{"data/mseq.db"};                     // NOLINT(readability-identifier-naming)
  CounterBackend counter_backend{CounterBackend::kSqlite};  // NOLINT(readability-identifier-naming)
  std::optional<std::string> redis_uri;                    // NOLINT(readability-identifier-naming)
  std::string actor{"cli"};                                // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;                     // NOLINT(readability-identifier-naming)
};

std::string handle_counter_backend(CliConfig& config, const std::string& value);

// Adds --db, --counter-backend, --redis, --actor and --trace to a subcommand's
// registry. Subcommand configs embed a CliConfig member named `common`.
template <typename Config>
void append_common_options(std::vector<apps::Option<Config>>& options) {
  options.push_back({"--db", true, "SQLite database file (default data/mseq.db)",
                     [](Config& c, const std::string& v) {
                       c.common.db_path = v;
                       return std::string();
                     }});
  options.push_back({"--counter-backend", true, "Sequence counter store (sqlite|redis)",
                     [](Config& c, const std::string& v) {
                       return handle_counter_backend(c.common, v);
                     }});
  options.push_back({"--redis", true, "Redis URI (tcp://host[:port] or redis://host[:port][/db])",
                     [](Config& c, const std::string& v) {
                       c.common.redis_uri = v;
                       return std::string();
                     }});
  options.push_back({"--actor", true, "User recorded in created_by/updated_by (default cli)",
                     [](Config& c, const std::string& v) {
                       c.common.actor = v;
                       return std::string();
                     }});
  options.push_back({"--trace", true, "Trace id for audit events (generated when absent)",
                     [](Config& c, const std::string& v) {
                       c.common.trace_id = v;
                       return std::string();
                     }});
}

// validate_cli_config checks startup preconditions shared by all subcommands.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - db_path is not empty
// - counter_backend == kRedis requires redis_uri
// - if redis_uri is present, parse_redis_uri() must succeed (format valid)
// - actor is not empty
[[nodiscard]] std::string validate_cli_config(const CliConfig& config);

}  // namespace mseq::cli
