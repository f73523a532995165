#pragma once

#ifdef MSEQ_TRANSPORT_BOUNDARY_GUARD
#error "Concrete storage/redis header included in a guarded translation unit; use interfaces only."
#endif

#include "mseq/storage/repositories.h"
#include "mseq/storage/sqlite/sqlite_db.h"

#include <memory>

namespace mseq::storage::sqlite {

// SqliteMachineRepository implements IMachineRepository with SQLite backend.
// Soft-deleted rows keep their machine_sequence but drop out of every
// live-only query, which releases the identifier for reuse.
class SqliteMachineRepository final : public IMachineRepository {
 public:
  explicit SqliteMachineRepository(std::shared_ptr<SqliteDb> db);

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
  std::shared_ptr<SqliteDb> db_;

  [[nodiscard]] core::Result<bool, core::StorageError> update_single_row(
      const char* sql, const std::string& value, const core::MachineId& id);
};

}  // namespace mseq::storage::sqlite
