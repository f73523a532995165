#pragma once

#include "mseq/storage/sequence_config_store.h"

#include <map>
#include <mutex>

namespace mseq::storage {

// InMemorySequenceConfigStore keeps configs in a std::map keyed by ConfigId.
// A single mutex makes compare_and_advance atomic with respect to every other
// write, which is all the allocator needs from a backend.
class InMemorySequenceConfigStore final : public ISequenceConfigStore {
 public:
  [[nodiscard]] core::Result<domain::SequenceConfig, core::StorageError> create(
      const domain::SequenceConfig& config) override;
  [[nodiscard]] std::optional<domain::SequenceConfig> get(
      const core::ConfigId& id) const override;
  [[nodiscard]] std::optional<domain::SequenceConfig> find_exact(
      const domain::SequenceScope& scope) const override;
  [[nodiscard]] std::vector<domain::SequenceConfig> list_all() const override;
  [[nodiscard]] core::Result<domain::SequenceConfig, core::StorageError> update(
      const domain::SequenceConfig& config, CounterWrite counter_write) override;
  [[nodiscard]] core::Result<domain::SequenceConfig, core::StorageError> advance(
      const core::ConfigId& id, std::int64_t new_current_sequence) override;
  [[nodiscard]] core::Result<domain::SequenceConfig, core::StorageError> compare_and_advance(
      const core::ConfigId& id, std::int64_t expected,
      std::int64_t new_current_sequence) override;
  [[nodiscard]] core::Result<domain::SequenceConfig, core::StorageError> remove(
      const core::ConfigId& id) override;

 private:
  mutable std::mutex mutex_;
  std::map<core::ConfigId, domain::SequenceConfig> configs_;
};

}  // namespace mseq::storage
