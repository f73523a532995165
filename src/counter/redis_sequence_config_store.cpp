#include "mseq/counter/redis_sequence_config_store.h"

#include <iterator>
#include <stdexcept>
#include <sw/redis++/redis++.h>
#include <unordered_map>

namespace mseq::counter {

using core::Result;
using core::StorageError;
using domain::SequenceConfig;

using ConfigResult = Result<SequenceConfig, StorageError>;

namespace {

// Create-if-absent. KEYS: config, scope index, id set. ARGV: config_id, field/value pairs.
constexpr const char* kCreateScript = R"LUA(
if redis.call('EXISTS', KEYS[2]) == 1 or redis.call('EXISTS', KEYS[1]) == 1 then
  return {'CONFLICT'}
end
for i = 2, #ARGV, 2 do
  redis.call('HSET', KEYS[1], ARGV[i], ARGV[i + 1])
end
redis.call('SET', KEYS[2], ARGV[1])
redis.call('SADD', KEYS[3], ARGV[1])
local out = redis.call('HGETALL', KEYS[1])
table.insert(out, 1, 'OK')
return out
)LUA";

// Field update on an existing config. KEYS: config. ARGV: field/value pairs.
constexpr const char* kUpdateScript = R"LUA(
if redis.call('EXISTS', KEYS[1]) == 0 then
  return {'NOT_FOUND'}
end
for i = 1, #ARGV, 2 do
  redis.call('HSET', KEYS[1], ARGV[i], ARGV[i + 1])
end
local out = redis.call('HGETALL', KEYS[1])
table.insert(out, 1, 'OK')
return out
)LUA";

// Counter compare-and-swap. KEYS: config. ARGV: expected, new.
// Values are compared as decimal strings; Lua numbers lose int64 precision.
constexpr const char* kCompareAndAdvanceScript = R"LUA(
if redis.call('EXISTS', KEYS[1]) == 0 then
  return {'NOT_FOUND'}
end
if redis.call('HGET', KEYS[1], 'current_sequence') ~= ARGV[1] then
  return {'CONFLICT'}
end
redis.call('HSET', KEYS[1], 'current_sequence', ARGV[2])
local out = redis.call('HGETALL', KEYS[1])
table.insert(out, 1, 'OK')
return out
)LUA";

// Delete. KEYS: config, scope index, id set. ARGV: config_id.
constexpr const char* kRemoveScript = R"LUA(
if redis.call('EXISTS', KEYS[1]) == 0 then
  return {'NOT_FOUND'}
end
local out = redis.call('HGETALL', KEYS[1])
redis.call('DEL', KEYS[1])
if redis.call('GET', KEYS[2]) == ARGV[1] then
  redis.call('DEL', KEYS[2])
end
redis.call('SREM', KEYS[3], ARGV[1])
table.insert(out, 1, 'OK')
return out
)LUA";

std::string subcategory_field(const domain::SequenceScope& scope) {
  return scope.subcategory_id.has_value() ? scope.subcategory_id->value : std::string();
}

// Settings fields shared by create and update; the counter is appended separately.
std::vector<std::string> settings_fields(const SequenceConfig& config) {
  return {
      "prefix",          config.prefix,
      "format",          config.format,
      "starting_number", std::to_string(config.starting_number),
      "is_active",       config.is_active ? "1" : "0",
      "updated_by",      config.updated_by,
      "updated_at",      config.updated_at,
  };
}

// Throws std::out_of_range / std::invalid_argument on a malformed hash.
SequenceConfig config_from_fields(const std::unordered_map<std::string, std::string>& fields) {
  SequenceConfig config;
  config.config_id = core::ConfigId{fields.at("config_id")};
  config.scope.category_id = core::CategoryId{fields.at("category_id")};
  const std::string& sub = fields.at("subcategory_id");
  if (!sub.empty()) {
    config.scope.subcategory_id = core::CategoryId{sub};
  }
  config.prefix = fields.at("prefix");
  config.format = fields.at("format");
  config.starting_number = std::stoll(fields.at("starting_number"));
  config.current_sequence = std::stoll(fields.at("current_sequence"));
  config.is_active = fields.at("is_active") == "1";
  config.created_by = fields.at("created_by");
  config.updated_by = fields.at("updated_by");
  config.created_at = fields.at("created_at");
  config.updated_at = fields.at("updated_at");
  return config;
}

}  // namespace

RedisSequenceConfigStore::RedisSequenceConfigStore(const RedisConfig& config,
                                                   std::string key_namespace)
    : namespace_(std::move(key_namespace)) {
  try {
    sw::redis::ConnectionOptions options;
    options.host = config.host;
    options.port = config.port;
    options.db = config.db_index;

    redis_ = std::make_unique<sw::redis::Redis>(options);
    redis_->ping();
    load_scripts();
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to connect to Redis: " + std::string(e.what()));
  }
}

RedisSequenceConfigStore::~RedisSequenceConfigStore() = default;

void RedisSequenceConfigStore::load_scripts() {
  create_script_sha_ = redis_->script_load(kCreateScript);
  update_script_sha_ = redis_->script_load(kUpdateScript);
  cas_script_sha_ = redis_->script_load(kCompareAndAdvanceScript);
  remove_script_sha_ = redis_->script_load(kRemoveScript);
}

std::string RedisSequenceConfigStore::config_key(const core::ConfigId& id) const {
  return namespace_ + ":seqcfg:" + id.value;
}

std::string RedisSequenceConfigStore::scope_key(const domain::SequenceScope& scope) const {
  return namespace_ + ":seqscope:" + scope.category_id.value + ":" + subcategory_field(scope);
}

std::string RedisSequenceConfigStore::ids_key() const { return namespace_ + ":seqcfg:ids"; }

ConfigResult RedisSequenceConfigStore::run_script(const std::string& sha,
                                                  const std::vector<std::string>& keys,
                                                  const std::vector<std::string>& args) {
  try {
    sw::redis::StringView script_sha{sha};
    auto reply = redis_->evalsha<std::vector<std::string>>(script_sha, keys.begin(), keys.end(),
                                                           args.begin(), args.end());
    if (reply.empty()) {
      return ConfigResult::err(StorageError::kUnavailable);
    }
    if (reply[0] == "NOT_FOUND") {
      return ConfigResult::err(StorageError::kNotFound);
    }
    if (reply[0] == "CONFLICT") {
      return ConfigResult::err(StorageError::kConflict);
    }

    std::unordered_map<std::string, std::string> fields;
    for (std::size_t i = 1; i + 1 < reply.size(); i += 2) {
      fields[reply[i]] = reply[i + 1];
    }
    return ConfigResult::ok(config_from_fields(fields));

  } catch (const std::exception& /*e*/) {
    return ConfigResult::err(StorageError::kUnavailable);
  }
}

ConfigResult RedisSequenceConfigStore::create(const SequenceConfig& config) {
  std::vector<std::string> args = {
      config.config_id.value,
      "config_id",        config.config_id.value,
      "category_id",      config.scope.category_id.value,
      "subcategory_id",   subcategory_field(config.scope),
      "current_sequence", std::to_string(config.current_sequence),
      "created_by",       config.created_by,
      "created_at",       config.created_at,
  };
  auto settings = settings_fields(config);
  args.insert(args.end(), settings.begin(), settings.end());

  return run_script(create_script_sha_,
                    {config_key(config.config_id), scope_key(config.scope), ids_key()}, args);
}

std::optional<SequenceConfig> RedisSequenceConfigStore::get(const core::ConfigId& id) const {
  try {
    std::unordered_map<std::string, std::string> fields;
    redis_->hgetall(config_key(id), std::inserter(fields, fields.end()));
    if (fields.empty()) {
      return std::nullopt;
    }
    return config_from_fields(fields);

  } catch (const std::exception& /*e*/) {
    return std::nullopt;
  }
}

std::optional<SequenceConfig> RedisSequenceConfigStore::find_exact(
    const domain::SequenceScope& scope) const {
  try {
    auto id = redis_->get(scope_key(scope));
    if (!id) {
      return std::nullopt;
    }
    return get(core::ConfigId{*id});

  } catch (const std::exception& /*e*/) {
    return std::nullopt;
  }
}

std::vector<SequenceConfig> RedisSequenceConfigStore::list_all() const {
  std::vector<std::string> ids;
  try {
    redis_->smembers(ids_key(), std::back_inserter(ids));
  } catch (const std::exception& /*e*/) {
    return {};
  }

  std::vector<SequenceConfig> result;
  result.reserve(ids.size());
  for (const auto& id : ids) {
    if (auto config = get(core::ConfigId{id})) {
      result.push_back(std::move(*config));
    }
  }
  storage::sort_newest_first(result);
  return result;
}

ConfigResult RedisSequenceConfigStore::update(const SequenceConfig& config,
                                              storage::CounterWrite counter_write) {
  auto args = settings_fields(config);
  if (counter_write == storage::CounterWrite::kOverwrite) {
    args.emplace_back("current_sequence");
    args.push_back(std::to_string(config.current_sequence));
  }
  return run_script(update_script_sha_, {config_key(config.config_id)}, args);
}

ConfigResult RedisSequenceConfigStore::advance(const core::ConfigId& id,
                                               std::int64_t new_current_sequence) {
  return run_script(update_script_sha_, {config_key(id)},
                    {"current_sequence", std::to_string(new_current_sequence)});
}

ConfigResult RedisSequenceConfigStore::compare_and_advance(const core::ConfigId& id,
                                                           std::int64_t expected,
                                                           std::int64_t new_current_sequence) {
  return run_script(cas_script_sha_, {config_key(id)},
                    {std::to_string(expected), std::to_string(new_current_sequence)});
}

ConfigResult RedisSequenceConfigStore::remove(const core::ConfigId& id) {
  auto existing = get(id);
  if (!existing.has_value()) {
    return ConfigResult::err(StorageError::kNotFound);
  }
  return run_script(remove_script_sha_, {config_key(id), scope_key(existing->scope), ids_key()},
                    {id.value});
}

}  // namespace mseq::counter
