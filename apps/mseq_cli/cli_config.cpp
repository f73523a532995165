#include "cli_config.h"

#include "mseq/counter/redis_config.h"

namespace mseq::cli {

std::string handle_counter_backend(CliConfig& config, const std::string& value) {
  if (value == "sqlite") {
    config.counter_backend = CounterBackend::kSqlite;
    return "";
  }
  if (value == "redis") {
    config.counter_backend = CounterBackend::kRedis;
    return "";
  }
  return "Invalid --counter-backend: " + value + " (valid: sqlite, redis)";
}

std::string validate_cli_config(const CliConfig& config) {
  if (config.db_path.empty()) {
    return "Error: --db <path> must not be empty";
  }

  if (config.counter_backend == CounterBackend::kRedis && !config.redis_uri.has_value()) {
    return "Error: --redis <uri> is required when --counter-backend redis.\n"
           "       Pass --redis tcp://host:port to enable it.";
  }

  if (config.redis_uri.has_value() &&
      !counter::parse_redis_uri(config.redis_uri.value()).has_value()) {
    return "Error: --redis URI '" + config.redis_uri.value() +
           "' is not a valid Redis URI.\n"
           "       Accepted formats: tcp://host:port, redis://host:port[/db], tcp://host";
  }

  if (config.actor.empty()) {
    return "Error: --actor must not be empty";
  }

  return "";
}

}  // namespace mseq::cli
