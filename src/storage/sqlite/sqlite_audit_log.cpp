#include "mseq/storage/sqlite/sqlite_audit_log.h"

#include <nlohmann/json.hpp>

#include <sqlite3.h>

namespace mseq::storage::sqlite {

namespace {

constexpr const char* kInsertEvent = R"(
  INSERT INTO audit_events
    (event_id, trace_id, event_type, payload, created_at, entity_ids_json, idx)
  VALUES (?1, ?2, ?3, ?4, ?5, ?6,
          (SELECT COALESCE(MAX(idx) + 1, 0) FROM audit_events WHERE trace_id = ?2))
)";

constexpr const char* kSelectEvents =
    "SELECT event_id, trace_id, event_type, payload, created_at, entity_ids_json"
    "  FROM audit_events";

AuditEvent event_from_row(const PreparedStatement& stmt) {
  AuditEvent event{stmt.column_text(0), stmt.column_text(1), stmt.column_text(2),
                   stmt.column_text(3), stmt.column_text(4), {}};
  // A malformed refs column reads as no refs.
  const auto refs = nlohmann::json::parse(stmt.column_text(5), nullptr, false);
  if (refs.is_array()) {
    for (const auto& ref : refs) {
      if (ref.is_string()) {
        event.refs.push_back(ref.get<std::string>());
      }
    }
  }
  return event;
}

}  // namespace

SqliteAuditLog::SqliteAuditLog(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

core::Result<bool, core::StorageError> SqliteAuditLog::append(const AuditEvent& event) {
  using R = core::Result<bool, core::StorageError>;

  PreparedStatement stmt(db_->connection(), kInsertEvent);
  if (!stmt.is_valid()) {
    return R::err(core::StorageError::kUnavailable);
  }
  stmt.bind_text(1, event.event_id);
  stmt.bind_text(2, event.trace_id);
  stmt.bind_text(3, event.event_type);
  stmt.bind_text(4, event.payload);
  stmt.bind_text(5, event.created_at);
  stmt.bind_text(6, nlohmann::json(event.refs).dump());

  const int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    return R::err(storage_error_from_rc(rc));
  }
  return R::ok(true);
}

std::vector<AuditEvent> SqliteAuditLog::query(const std::string& trace_id) const {
  std::string sql = kSelectEvents;
  sql += trace_id.empty() ? " ORDER BY rowid" : " WHERE trace_id = ? ORDER BY idx";
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return {};
  }
  if (!trace_id.empty()) {
    stmt.bind_text(1, trace_id);
  }

  std::vector<AuditEvent> events;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    events.push_back(event_from_row(stmt));
  }
  return events;
}

std::vector<std::string> SqliteAuditLog::list_trace_ids() const {
  PreparedStatement stmt(db_->connection(),
                         "SELECT DISTINCT trace_id FROM audit_events ORDER BY trace_id");
  if (!stmt.is_valid()) {
    return {};
  }
  std::vector<std::string> ids;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    ids.push_back(stmt.column_text(0));
  }
  return ids;
}

}  // namespace mseq::storage::sqlite
