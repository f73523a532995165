#include "mseq/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

#include <utility>

namespace mseq::storage::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;

// sequence_configs.subcategory_id is '' for a category-wide counter so that the
// UNIQUE constraint covers it too (SQLite treats NULLs as distinct).
// machines.machine_sequence carries no unique index: deleted rows keep their
// identifier, and only live rows take part in uniqueness.
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS categories (
  category_id TEXT PRIMARY KEY,
  name TEXT NOT NULL,
  slug TEXT NOT NULL,
  parent_id TEXT,
  level INTEGER NOT NULL DEFAULT 0
);

CREATE INDEX IF NOT EXISTS idx_categories_parent ON categories(parent_id);

CREATE TABLE IF NOT EXISTS machines (
  machine_id TEXT PRIMARY KEY,
  name TEXT NOT NULL,
  category_id TEXT NOT NULL,
  subcategory_id TEXT,
  machine_sequence TEXT NOT NULL DEFAULT '',
  deleted_at TEXT
);

CREATE INDEX IF NOT EXISTS idx_machines_sequence ON machines(machine_sequence);
CREATE INDEX IF NOT EXISTS idx_machines_scope ON machines(category_id, subcategory_id);

CREATE TABLE IF NOT EXISTS sequence_configs (
  config_id TEXT PRIMARY KEY,
  category_id TEXT NOT NULL,
  subcategory_id TEXT NOT NULL DEFAULT '',
  prefix TEXT NOT NULL,
  format TEXT NOT NULL,
  starting_number INTEGER NOT NULL CHECK(starting_number >= 1),
  current_sequence INTEGER NOT NULL,
  is_active INTEGER NOT NULL CHECK(is_active IN (0, 1)),
  created_by TEXT NOT NULL,
  updated_by TEXT NOT NULL,
  created_at TEXT NOT NULL,
  updated_at TEXT NOT NULL,
  UNIQUE(category_id, subcategory_id)
);

CREATE TABLE IF NOT EXISTS audit_events (
  event_id TEXT PRIMARY KEY,
  trace_id TEXT NOT NULL,
  event_type TEXT NOT NULL,
  payload TEXT NOT NULL,
  created_at TEXT NOT NULL,
  entity_ids_json TEXT NOT NULL,
  idx INTEGER NOT NULL
);

CREATE UNIQUE INDEX IF NOT EXISTS idx_audit_events_trace ON audit_events(trace_id, idx);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (1, datetime('now'));
)";

// Runs a multi-statement script. The error is SQLite's own message.
core::Result<bool, std::string> run_script(sqlite3* db, const char* sql) {
  char* raw_error = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &raw_error) == SQLITE_OK) {
    return core::Result<bool, std::string>::ok(true);
  }
  std::string message = raw_error != nullptr ? raw_error : sqlite3_errmsg(db);
  sqlite3_free(raw_error);
  return core::Result<bool, std::string>::err(std::move(message));
}

}  // namespace

void SqliteDb::Closer::operator()(sqlite3* db) const { sqlite3_close(db); }

void PreparedStatement::Finalizer::operator()(sqlite3_stmt* stmt) const {
  sqlite3_finalize(stmt);
}

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  using R = core::Result<std::shared_ptr<SqliteDb>, std::string>;

  sqlite3* raw = nullptr;
  const int rc = sqlite3_open(path.c_str(), &raw);
  // sqlite3_open hands back a handle even on failure; wrap it so it gets closed.
  std::shared_ptr<SqliteDb> db(new SqliteDb(raw));
  if (rc != SQLITE_OK) {
    return R::err("Failed to open database " + path + ": " +
                  (raw != nullptr ? sqlite3_errmsg(raw) : "out of memory"));
  }

  sqlite3_busy_timeout(raw, kBusyTimeoutMs);
  return R::ok(std::move(db));
}

int SqliteDb::schema_version() const {
  PreparedStatement stmt(db_.get(), "SELECT MAX(version) FROM schema_version");
  if (!stmt.is_valid() || sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return 0;  // no schema_version table yet
  }
  return static_cast<int>(stmt.column_int64(0));
}

core::Result<bool, std::string> SqliteDb::ensure_schema_v1() {
  if (schema_version() >= 1) {
    return core::Result<bool, std::string>::ok(true);
  }

  auto applied = run_script(db_.get(), kSchemaV1);
  if (!applied.has_value()) {
    return core::Result<bool, std::string>::err("Failed to apply schema v1: " + applied.error());
  }
  return applied;
}

PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    error_ = sqlite3_errmsg(db);
    return;
  }
  stmt_.reset(raw);
}

void PreparedStatement::bind_text(int index, const std::string& value) {
  sqlite3_bind_text(stmt_.get(), index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void PreparedStatement::bind_optional_text(int index, const std::optional<std::string>& value) {
  if (value.has_value()) {
    bind_text(index, *value);
  } else {
    sqlite3_bind_null(stmt_.get(), index);
  }
}

void PreparedStatement::bind_int64(int index, long long value) {
  sqlite3_bind_int64(stmt_.get(), index, static_cast<sqlite3_int64>(value));
}

std::string PreparedStatement::column_text(int index) const {
  const unsigned char* raw = sqlite3_column_text(stmt_.get(), index);
  if (raw == nullptr) {
    return {};
  }
  return reinterpret_cast<const char*>(raw);  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
}

std::optional<std::string> PreparedStatement::column_optional_text(int index) const {
  if (sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL) {
    return std::nullopt;
  }
  return column_text(index);
}

long long PreparedStatement::column_int64(int index) const {
  return static_cast<long long>(sqlite3_column_int64(stmt_.get(), index));
}

core::StorageError storage_error_from_rc(int rc) {
  // Extended result codes keep the primary code in the low byte.
  if ((rc & 0xff) == SQLITE_CONSTRAINT) {
    return core::StorageError::kConflict;
  }
  return core::StorageError::kUnavailable;
}

}  // namespace mseq::storage::sqlite
