#pragma once

#include "mseq/storage/repositories.h"

#include <map>
#include <mutex>

namespace mseq::storage {

// InMemoryMachineRepository stores Machines in a std::map guarded by a mutex,
// so concurrent allocators can probe and assign identifiers safely.
class InMemoryMachineRepository final : public IMachineRepository {
 public:
  core::Result<bool, core::StorageError> upsert(const domain::Machine& machine) override;
  [[nodiscard]] std::optional<domain::Machine> get(const core::MachineId& id) const override;
  [[nodiscard]] std::vector<domain::Machine> list_all() const override;

  [[nodiscard]] bool exists_live_with_identifier(const std::string& identifier) const override;
  [[nodiscard]] std::vector<domain::MachineRef> list_live_by_scope(
      const core::CategoryId& category_id,
      const std::optional<core::CategoryId>& subcategory_id) const override;

  [[nodiscard]] core::Result<bool, core::StorageError> set_identifier(
      const core::MachineId& id, const std::string& identifier) override;
  [[nodiscard]] core::Result<bool, core::StorageError> soft_delete(
      const core::MachineId& id, const std::string& deleted_at) override;

 private:
  mutable std::mutex mutex_;
  std::map<core::MachineId, domain::Machine> machines_;
};

}  // namespace mseq::storage
