#include "mseq/storage/sqlite/sqlite_machine_repository.h"

#include <sqlite3.h>

namespace mseq::storage::sqlite {

using core::Result;
using core::StorageError;

namespace {

constexpr const char* kSelectColumns =
    "SELECT machine_id, name, category_id, subcategory_id, machine_sequence, deleted_at";

domain::Machine read_machine(const PreparedStatement& stmt) {
  domain::Machine machine;
  machine.machine_id = core::MachineId{stmt.column_text(0)};
  machine.name = stmt.column_text(1);
  machine.category_id = core::CategoryId{stmt.column_text(2)};
  if (auto sub = stmt.column_optional_text(3)) {
    machine.subcategory_id = core::CategoryId{*sub};
  }
  machine.machine_sequence = stmt.column_text(4);
  machine.deleted_at = stmt.column_optional_text(5);
  return machine;
}

}  // namespace

SqliteMachineRepository::SqliteMachineRepository(std::shared_ptr<SqliteDb> db)
    : db_(std::move(db)) {}

core::Result<bool, core::StorageError> SqliteMachineRepository::upsert(
    const domain::Machine& machine) {
  using R = core::Result<bool, core::StorageError>;
  const char* sql = R"(
    INSERT INTO machines
      (machine_id, name, category_id, subcategory_id, machine_sequence, deleted_at)
    VALUES (?, ?, ?, ?, ?, ?)
    ON CONFLICT(machine_id) DO UPDATE SET
      name = excluded.name,
      category_id = excluded.category_id,
      subcategory_id = excluded.subcategory_id,
      machine_sequence = excluded.machine_sequence,
      deleted_at = excluded.deleted_at
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return R::err(core::StorageError::kUnavailable);
  }

  stmt.bind_text(1, machine.machine_id.value);
  stmt.bind_text(2, machine.name);
  stmt.bind_text(3, machine.category_id.value);
  if (machine.subcategory_id.has_value()) {
    stmt.bind_text(4, machine.subcategory_id->value);
  } else {
    stmt.bind_optional_text(4, std::nullopt);
  }
  stmt.bind_text(5, machine.machine_sequence);
  stmt.bind_optional_text(6, machine.deleted_at);

  const int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    return R::err(storage_error_from_rc(rc));
  }
  return R::ok(true);
}

std::optional<domain::Machine> SqliteMachineRepository::get(const core::MachineId& id) const {
  PreparedStatement stmt(db_->connection(),
                         std::string(kSelectColumns) + " FROM machines WHERE machine_id = ?");
  if (!stmt.is_valid()) {
    return std::nullopt;
  }

  stmt.bind_text(1, id.value);

  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return read_machine(stmt);
  }
  return std::nullopt;
}

std::vector<domain::Machine> SqliteMachineRepository::list_all() const {
  PreparedStatement stmt(db_->connection(),
                         std::string(kSelectColumns) + " FROM machines ORDER BY machine_id");
  if (!stmt.is_valid()) {
    return {};
  }

  std::vector<domain::Machine> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    result.push_back(read_machine(stmt));
  }
  return result;
}

bool SqliteMachineRepository::exists_live_with_identifier(const std::string& identifier) const {
  const char* sql =
      "SELECT 1 FROM machines WHERE machine_sequence = ? AND deleted_at IS NULL LIMIT 1";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    // Unknown state counts as taken; the allocator then moves on to the next number.
    return true;
  }

  stmt.bind_text(1, identifier);
  return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

std::vector<domain::MachineRef> SqliteMachineRepository::list_live_by_scope(
    const core::CategoryId& category_id,
    const std::optional<core::CategoryId>& subcategory_id) const {
  std::string sql =
      "SELECT machine_id, machine_sequence FROM machines"
      " WHERE category_id = ? AND deleted_at IS NULL";
  sql += subcategory_id.has_value() ? " AND subcategory_id = ?" : " AND subcategory_id IS NULL";
  sql += " ORDER BY machine_id";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return {};
  }

  stmt.bind_text(1, category_id.value);
  if (subcategory_id.has_value()) {
    stmt.bind_text(2, subcategory_id->value);
  }

  std::vector<domain::MachineRef> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    result.push_back(domain::MachineRef{core::MachineId{stmt.column_text(0)}, stmt.column_text(1)});
  }
  return result;
}

Result<bool, StorageError> SqliteMachineRepository::set_identifier(const core::MachineId& id,
                                                                   const std::string& identifier) {
  return update_single_row("UPDATE machines SET machine_sequence = ? WHERE machine_id = ?",
                           identifier, id);
}

Result<bool, StorageError> SqliteMachineRepository::soft_delete(const core::MachineId& id,
                                                                const std::string& deleted_at) {
  return update_single_row("UPDATE machines SET deleted_at = ? WHERE machine_id = ?", deleted_at,
                           id);
}

Result<bool, StorageError> SqliteMachineRepository::update_single_row(const char* sql,
                                                                      const std::string& value,
                                                                      const core::MachineId& id) {
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return Result<bool, StorageError>::err(StorageError::kUnavailable);
  }

  stmt.bind_text(1, value);
  stmt.bind_text(2, id.value);

  const int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    return Result<bool, StorageError>::err(storage_error_from_rc(rc));
  }
  if (sqlite3_changes(db_->connection()) == 0) {
    return Result<bool, StorageError>::err(StorageError::kNotFound);
  }
  return Result<bool, StorageError>::ok(true);
}

}  // namespace mseq::storage::sqlite
