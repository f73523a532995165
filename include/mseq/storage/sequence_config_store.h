#pragma once

#include "mseq/core/ids.h"
#include "mseq/core/result.h"
#include "mseq/domain/sequence_config.h"
#include "mseq/domain/sequence_scope.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace mseq::storage {

// CounterWrite controls whether update() also overwrites current_sequence.
// Settings edits leave the counter alone so they cannot clobber allocations
// that happened between the read and the write.
enum class CounterWrite {
  kKeep,
  kOverwrite,
};

// ISequenceConfigStore persists one SequenceConfig per scope.
//
// Contract:
// - create() rejects a second config for the same exact scope with kConflict,
//   whether or not the existing one is active.
// - advance() is a single-field write of current_sequence.
// - compare_and_advance() writes current_sequence only if it still equals
//   `expected`; otherwise it returns kConflict and changes nothing. This is the
//   only primitive the allocator uses to commit, so two allocators can never
//   both claim the same range of numbers.
// - All writes return the post-write record.
class ISequenceConfigStore {
 public:
  virtual ~ISequenceConfigStore() = default;

  [[nodiscard]] virtual core::Result<domain::SequenceConfig, core::StorageError> create(
      const domain::SequenceConfig& config) = 0;

  [[nodiscard]] virtual std::optional<domain::SequenceConfig> get(
      const core::ConfigId& id) const = 0;

  // Exact scope lookup, active or not.
  [[nodiscard]] virtual std::optional<domain::SequenceConfig> find_exact(
      const domain::SequenceScope& scope) const = 0;

  // All configs, newest first by created_at (ties broken by config_id).
  [[nodiscard]] virtual std::vector<domain::SequenceConfig> list_all() const = 0;

  [[nodiscard]] virtual core::Result<domain::SequenceConfig, core::StorageError> update(
      const domain::SequenceConfig& config, CounterWrite counter_write) = 0;

  [[nodiscard]] virtual core::Result<domain::SequenceConfig, core::StorageError> advance(
      const core::ConfigId& id, std::int64_t new_current_sequence) = 0;

  [[nodiscard]] virtual core::Result<domain::SequenceConfig, core::StorageError>
  compare_and_advance(const core::ConfigId& id, std::int64_t expected,
                      std::int64_t new_current_sequence) = 0;

  [[nodiscard]] virtual core::Result<domain::SequenceConfig, core::StorageError> remove(
      const core::ConfigId& id) = 0;
};

// resolve_config returns the active config for the exact scope, falling back to
// the active category-wide config when the scope has a subcategory without a
// dedicated counter.
[[nodiscard]] std::optional<domain::SequenceConfig> resolve_config(
    const ISequenceConfigStore& store, const domain::SequenceScope& scope);

// Sort order shared by every backend's list_all().
void sort_newest_first(std::vector<domain::SequenceConfig>& configs);

}  // namespace mseq::storage
