#pragma once

#ifdef MSEQ_TRANSPORT_BOUNDARY_GUARD
#error "Concrete storage/redis header included in a guarded translation unit; use interfaces only."
#endif

#include "mseq/storage/repositories.h"
#include "mseq/storage/sqlite/sqlite_db.h"

#include <memory>

namespace mseq::storage::sqlite {

// SqliteCategoryDirectory implements ICategoryDirectory with SQLite backend.
class SqliteCategoryDirectory final : public ICategoryDirectory {
 public:
  explicit SqliteCategoryDirectory(std::shared_ptr<SqliteDb> db);

  core::Result<bool, core::StorageError> upsert(const domain::Category& category) override;
  [[nodiscard]] std::optional<domain::Category> get(const core::CategoryId& id) const override;
  [[nodiscard]] std::vector<domain::Category> list_all() const override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace mseq::storage::sqlite
