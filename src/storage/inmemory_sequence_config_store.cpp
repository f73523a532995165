#include "mseq/storage/inmemory_sequence_config_store.h"

namespace mseq::storage {

using core::Result;
using core::StorageError;
using domain::SequenceConfig;

using ConfigResult = Result<SequenceConfig, StorageError>;

ConfigResult InMemorySequenceConfigStore::create(const SequenceConfig& config) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (configs_.contains(config.config_id)) {
    return ConfigResult::err(StorageError::kConflict);
  }
  for (const auto& [id, existing] : configs_) {
    if (existing.scope == config.scope) {
      return ConfigResult::err(StorageError::kConflict);
    }
  }
  configs_[config.config_id] = config;
  return ConfigResult::ok(config);
}

std::optional<SequenceConfig> InMemorySequenceConfigStore::get(const core::ConfigId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = configs_.find(id);
  if (it != configs_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::optional<SequenceConfig> InMemorySequenceConfigStore::find_exact(
    const domain::SequenceScope& scope) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [id, config] : configs_) {
    if (config.scope == scope) {
      return config;
    }
  }
  return std::nullopt;
}

std::vector<SequenceConfig> InMemorySequenceConfigStore::list_all() const {
  std::vector<SequenceConfig> result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    result.reserve(configs_.size());
    for (const auto& [id, config] : configs_) {
      result.push_back(config);
    }
  }
  sort_newest_first(result);
  return result;
}

ConfigResult InMemorySequenceConfigStore::update(const SequenceConfig& config,
                                                 CounterWrite counter_write) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = configs_.find(config.config_id);
  if (it == configs_.end()) {
    return ConfigResult::err(StorageError::kNotFound);
  }

  const std::int64_t current = it->second.current_sequence;
  it->second = config;
  if (counter_write == CounterWrite::kKeep) {
    it->second.current_sequence = current;
  }
  return ConfigResult::ok(it->second);
}

ConfigResult InMemorySequenceConfigStore::advance(const core::ConfigId& id,
                                                  std::int64_t new_current_sequence) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = configs_.find(id);
  if (it == configs_.end()) {
    return ConfigResult::err(StorageError::kNotFound);
  }
  it->second.current_sequence = new_current_sequence;
  return ConfigResult::ok(it->second);
}

ConfigResult InMemorySequenceConfigStore::compare_and_advance(const core::ConfigId& id,
                                                              std::int64_t expected,
                                                              std::int64_t new_current_sequence) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = configs_.find(id);
  if (it == configs_.end()) {
    return ConfigResult::err(StorageError::kNotFound);
  }
  if (it->second.current_sequence != expected) {
    return ConfigResult::err(StorageError::kConflict);
  }
  it->second.current_sequence = new_current_sequence;
  return ConfigResult::ok(it->second);
}

ConfigResult InMemorySequenceConfigStore::remove(const core::ConfigId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = configs_.find(id);
  if (it == configs_.end()) {
    return ConfigResult::err(StorageError::kNotFound);
  }
  SequenceConfig removed = it->second;
  configs_.erase(it);
  return ConfigResult::ok(removed);
}

}  // namespace mseq::storage
