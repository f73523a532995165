#include "mseq/counter/redis_config.h"

#include <array>
#include <charconv>
#include <string_view>

namespace mseq::counter {

namespace {

struct Scheme {
  std::string_view prefix;
  bool allows_db;
};

constexpr std::array<Scheme, 2> kSchemes{{
    {"tcp://", false},
    {"redis://", true},
}};

// Digits only; from_chars alone would accept a leading '-'.
std::optional<int> parse_unsigned(std::string_view text) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string_view::npos) {
    return std::nullopt;
  }
  int value = 0;
  const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<RedisConfig> parse_redis_uri(const std::string& uri) {
  std::string_view rest{uri};
  const Scheme* scheme = nullptr;
  for (const auto& candidate : kSchemes) {
    if (rest.starts_with(candidate.prefix)) {
      scheme = &candidate;
      rest.remove_prefix(candidate.prefix.size());
      break;
    }
  }
  if (scheme == nullptr) {
    return std::nullopt;
  }

  RedisConfig config;
  config.uri = uri;

  if (const auto slash = rest.find('/'); slash != std::string_view::npos) {
    if (!scheme->allows_db) {
      return std::nullopt;
    }
    const auto db = parse_unsigned(rest.substr(slash + 1));
    if (!db) {
      return std::nullopt;
    }
    config.db_index = *db;
    rest = rest.substr(0, slash);
  }

  // The last colon splits off the port.
  if (const auto colon = rest.rfind(':'); colon != std::string_view::npos) {
    const auto port = parse_unsigned(rest.substr(colon + 1));
    if (!port || *port < 1 || *port > 65535) {
      return std::nullopt;
    }
    config.port = *port;
    rest = rest.substr(0, colon);
  }

  if (rest.empty()) {
    return std::nullopt;
  }
  config.host = std::string{rest};
  return config;
}

std::string redis_config_to_log_string(const RedisConfig& config) {
  std::string text = config.host;
  text += ':';
  text += std::to_string(config.port);
  if (config.db_index != 0) {
    text += '/';
    text += std::to_string(config.db_index);
  }
  return text;
}

}  // namespace mseq::counter
