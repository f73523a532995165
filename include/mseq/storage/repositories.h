#pragma once

#include "mseq/core/ids.h"
#include "mseq/core/result.h"
#include "mseq/domain/category.h"
#include "mseq/domain/machine.h"

#include <optional>
#include <string>
#include <vector>

namespace mseq::storage {

// Repository interfaces isolate persistence for deterministic testing.
// Category tree management lives elsewhere; the engine only needs lookups.
class ICategoryDirectory {
 public:
  virtual ~ICategoryDirectory() = default;
  virtual core::Result<bool, core::StorageError> upsert(const domain::Category& category) = 0;
  [[nodiscard]] virtual std::optional<domain::Category> get(const core::CategoryId& id) const = 0;
  [[nodiscard]] virtual std::vector<domain::Category> list_all() const = 0;
};

// IMachineRepository is the machine collaborator. Identifier uniqueness is
// enforced here at the application layer: deleted machines release their
// identifiers, so no storage-level unique index can express it.
class IMachineRepository {
 public:
  virtual ~IMachineRepository() = default;
  // Insert or replace by machine_id; kUnavailable when the backend refuses the write.
  virtual core::Result<bool, core::StorageError> upsert(const domain::Machine& machine) = 0;
  [[nodiscard]] virtual std::optional<domain::Machine> get(const core::MachineId& id) const = 0;
  [[nodiscard]] virtual std::vector<domain::Machine> list_all() const = 0;

  // Uniqueness oracle: does a live machine already carry this exact identifier?
  [[nodiscard]] virtual bool exists_live_with_identifier(const std::string& identifier) const = 0;

  // Live machines whose scope matches exactly. A nullopt subcategory matches
  // machines without a subcategory only, never "any subcategory".
  [[nodiscard]] virtual std::vector<domain::MachineRef> list_live_by_scope(
      const core::CategoryId& category_id,
      const std::optional<core::CategoryId>& subcategory_id) const = 0;

  [[nodiscard]] virtual core::Result<bool, core::StorageError> set_identifier(
      const core::MachineId& id, const std::string& identifier) = 0;

  [[nodiscard]] virtual core::Result<bool, core::StorageError> soft_delete(
      const core::MachineId& id, const std::string& deleted_at) = 0;
};

}  // namespace mseq::storage
