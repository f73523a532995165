#include "mseq/storage/inmemory_machine_repository.h"

namespace mseq::storage {

using core::Result;
using core::StorageError;

core::Result<bool, core::StorageError> InMemoryMachineRepository::upsert(
    const domain::Machine& machine) {
  std::lock_guard<std::mutex> lock(mutex_);
  machines_[machine.machine_id] = machine;
  return core::Result<bool, core::StorageError>::ok(true);
}

std::optional<domain::Machine> InMemoryMachineRepository::get(const core::MachineId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = machines_.find(id);
  if (it != machines_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::vector<domain::Machine> InMemoryMachineRepository::list_all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<domain::Machine> result;
  result.reserve(machines_.size());
  for (const auto& [id, machine] : machines_) {
    result.push_back(machine);
  }
  return result;
}

bool InMemoryMachineRepository::exists_live_with_identifier(const std::string& identifier) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [id, machine] : machines_) {
    if (machine.is_live() && machine.machine_sequence == identifier) {
      return true;
    }
  }
  return false;
}

std::vector<domain::MachineRef> InMemoryMachineRepository::list_live_by_scope(
    const core::CategoryId& category_id,
    const std::optional<core::CategoryId>& subcategory_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<domain::MachineRef> result;
  for (const auto& [id, machine] : machines_) {
    if (!machine.is_live() || machine.category_id != category_id) {
      continue;
    }
    if (machine.subcategory_id != subcategory_id) {
      continue;
    }
    result.push_back(domain::MachineRef{machine.machine_id, machine.machine_sequence});
  }
  return result;
}

Result<bool, StorageError> InMemoryMachineRepository::set_identifier(
    const core::MachineId& id, const std::string& identifier) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = machines_.find(id);
  if (it == machines_.end()) {
    return Result<bool, StorageError>::err(StorageError::kNotFound);
  }
  it->second.machine_sequence = identifier;
  return Result<bool, StorageError>::ok(true);
}

Result<bool, StorageError> InMemoryMachineRepository::soft_delete(const core::MachineId& id,
                                                                  const std::string& deleted_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = machines_.find(id);
  if (it == machines_.end()) {
    return Result<bool, StorageError>::err(StorageError::kNotFound);
  }
  it->second.deleted_at = deleted_at;
  return Result<bool, StorageError>::ok(true);
}

}  // namespace mseq::storage
