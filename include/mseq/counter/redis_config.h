#pragma once

#include <optional>
#include <string>

namespace mseq::counter {

inline constexpr int kDefaultRedisPort = 6379;

// Prefix of every key the counter store writes.
inline constexpr const char* kDefaultKeyNamespace = "mseq";

// Connection target of the Redis-backed counter store, parsed from --redis.
//   tcp://host[:port]
//   redis://host[:port][/db]
struct RedisConfig {
  std::string uri;                 // as given, for diagnostics
  std::string host;
  int port{kDefaultRedisPort};
  int db_index{0};                 // SELECT target; only redis:// may set it
};

// nullopt for an unknown scheme, an empty host, a port outside 1-65535 or a
// database suffix that is not a plain decimal.
[[nodiscard]] std::optional<RedisConfig> parse_redis_uri(const std::string& uri);

// "host:port", with "/db" appended when a database other than 0 is selected.
[[nodiscard]] std::string redis_config_to_log_string(const RedisConfig& config);

}  // namespace mseq::counter
