#pragma once

#include "mseq/core/result.h"

#include <memory>
#include <optional>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace mseq::storage::sqlite {

// SqliteDb owns the connection shared by the SQLite-backed stores of one process.
// Several CLI processes may allocate from the same file, so the connection waits
// on a locked database (busy timeout) instead of failing the counter swap.
// Schema creation is explicit through ensure_schema_v1().
class SqliteDb {
 public:
  // ":memory:" opens a private in-memory database.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;

  // 0 before any schema was applied.
  [[nodiscard]] int schema_version() const;

  // Idempotent.
  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v1();

  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

 private:
  struct Closer {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, Closer> db_;
};

// Finalized on destruction. Bind indices are 1-based and column indices
// 0-based, as in the C API.
class PreparedStatement {
 public:
  PreparedStatement(sqlite3* db, const std::string& sql);

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }
  [[nodiscard]] const std::string& error() const { return error_; }
  [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }

  void bind_text(int index, const std::string& value);
  void bind_optional_text(int index, const std::optional<std::string>& value);  // nullopt binds NULL
  void bind_int64(int index, long long value);

  // NULL reads as "" or nullopt.
  [[nodiscard]] std::string column_text(int index) const;
  [[nodiscard]] std::optional<std::string> column_optional_text(int index) const;
  [[nodiscard]] long long column_int64(int index) const;

 private:
  struct Finalizer {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, Finalizer> stmt_;
  std::string error_;
};

// Constraint violations map to kConflict; any other failure to kUnavailable.
[[nodiscard]] core::StorageError storage_error_from_rc(int rc);

}  // namespace mseq::storage::sqlite
