#pragma once

#ifdef MSEQ_TRANSPORT_BOUNDARY_GUARD
#error "Concrete storage/redis header included in a guarded translation unit; use interfaces only."
#endif

#include "mseq/counter/redis_config.h"
#include "mseq/storage/sequence_config_store.h"

#include <memory>
#include <string>
#include <vector>

// Forward declare Redis++ types to avoid exposing them in header
namespace sw {
namespace redis {
class Redis;
}
}  // namespace sw

namespace mseq::counter {

// RedisSequenceConfigStore keeps sequence counters in Redis so several
// processes can allocate identifiers from the same scopes.
//
// Redis data model ({ns} defaults to kDefaultKeyNamespace):
// - Config:      {ns}:seqcfg:{config_id} (hash)
//   - Fields: category_id, subcategory_id ('' when category-wide), prefix, format,
//     starting_number, current_sequence, is_active (0/1), created_by, updated_by,
//     created_at, updated_at
// - Scope index: {ns}:seqscope:{category_id}:{subcategory_id} (string -> config_id)
// - Id set:      {ns}:seqcfg:ids (set of config_id)
//
// Atomicity: create-if-absent, field updates, compare-and-swap and delete are
// Lua scripts, so each is a single atomic step on the server. Every script
// replies {"OK", HGETALL...} on success or {"NOT_FOUND"} / {"CONFLICT"}.
//
// Redis++ exceptions never cross this class: writes map them to kUnavailable,
// reads to nullopt / empty.
class RedisSequenceConfigStore final : public storage::ISequenceConfigStore {
 public:
  // Throws std::runtime_error if the connection or script loading fails.
  explicit RedisSequenceConfigStore(const RedisConfig& config,
                                    std::string key_namespace = kDefaultKeyNamespace);

  ~RedisSequenceConfigStore() override;

  RedisSequenceConfigStore(const RedisSequenceConfigStore&) = delete;
  RedisSequenceConfigStore& operator=(const RedisSequenceConfigStore&) = delete;
  RedisSequenceConfigStore(RedisSequenceConfigStore&&) = delete;
  RedisSequenceConfigStore& operator=(RedisSequenceConfigStore&&) = delete;

  [[nodiscard]] core::Result<domain::SequenceConfig, core::StorageError> create(
      const domain::SequenceConfig& config) override;
  [[nodiscard]] std::optional<domain::SequenceConfig> get(
      const core::ConfigId& id) const override;
  [[nodiscard]] std::optional<domain::SequenceConfig> find_exact(
      const domain::SequenceScope& scope) const override;
  [[nodiscard]] std::vector<domain::SequenceConfig> list_all() const override;
  [[nodiscard]] core::Result<domain::SequenceConfig, core::StorageError> update(
      const domain::SequenceConfig& config, storage::CounterWrite counter_write) override;
  [[nodiscard]] core::Result<domain::SequenceConfig, core::StorageError> advance(
      const core::ConfigId& id, std::int64_t new_current_sequence) override;
  [[nodiscard]] core::Result<domain::SequenceConfig, core::StorageError> compare_and_advance(
      const core::ConfigId& id, std::int64_t expected,
      std::int64_t new_current_sequence) override;
  [[nodiscard]] core::Result<domain::SequenceConfig, core::StorageError> remove(
      const core::ConfigId& id) override;

 private:
  std::unique_ptr<sw::redis::Redis> redis_;
  std::string namespace_;

  std::string create_script_sha_;
  std::string update_script_sha_;
  std::string cas_script_sha_;
  std::string remove_script_sha_;

  void load_scripts();

  [[nodiscard]] std::string config_key(const core::ConfigId& id) const;
  [[nodiscard]] std::string scope_key(const domain::SequenceScope& scope) const;
  [[nodiscard]] std::string ids_key() const;

  // Runs a cached script and decodes its {"OK", fields...} reply.
  [[nodiscard]] core::Result<domain::SequenceConfig, core::StorageError> run_script(
      const std::string& sha, const std::vector<std::string>& keys,
      const std::vector<std::string>& args);
};

}  // namespace mseq::counter
