#pragma once

#ifdef MSEQ_TRANSPORT_BOUNDARY_GUARD
#error "Concrete storage/redis header included in a guarded translation unit; use interfaces only."
#endif

#include "mseq/storage/audit_log.h"
#include "mseq/storage/sqlite/sqlite_db.h"

#include <memory>

namespace mseq::storage::sqlite {

// Rows of audit_events. The per-trace position (idx) is assigned inside the
// INSERT, so processes sharing the file keep one gap-free order per trace.
class SqliteAuditLog final : public IAuditLog {
 public:
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::Result<bool, core::StorageError> append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace mseq::storage::sqlite
