#include "mseq/storage/sqlite/sqlite_sequence_config_store.h"

#include <sqlite3.h>

namespace mseq::storage::sqlite {

using core::Result;
using core::StorageError;
using domain::SequenceConfig;

using ConfigResult = Result<SequenceConfig, StorageError>;

namespace {

constexpr const char* kColumns =
    "config_id, category_id, subcategory_id, prefix, format, starting_number,"
    " current_sequence, is_active, created_by, updated_by, created_at, updated_at";

// The category-wide scope is stored as '' so that UNIQUE(category_id, subcategory_id)
// also covers it.
std::string subcategory_column(const domain::SequenceScope& scope) {
  return scope.subcategory_id.has_value() ? scope.subcategory_id->value : std::string();
}

SequenceConfig read_config(const PreparedStatement& stmt) {
  SequenceConfig config;
  config.config_id = core::ConfigId{stmt.column_text(0)};
  config.scope.category_id = core::CategoryId{stmt.column_text(1)};
  const std::string sub = stmt.column_text(2);
  if (!sub.empty()) {
    config.scope.subcategory_id = core::CategoryId{sub};
  }
  config.prefix = stmt.column_text(3);
  config.format = stmt.column_text(4);
  config.starting_number = stmt.column_int64(5);
  config.current_sequence = stmt.column_int64(6);
  config.is_active = stmt.column_int64(7) != 0;
  config.created_by = stmt.column_text(8);
  config.updated_by = stmt.column_text(9);
  config.created_at = stmt.column_text(10);
  config.updated_at = stmt.column_text(11);
  return config;
}

}  // namespace

SqliteSequenceConfigStore::SqliteSequenceConfigStore(std::shared_ptr<SqliteDb> db)
    : db_(std::move(db)) {}

ConfigResult SqliteSequenceConfigStore::step_single(PreparedStatement& stmt) const {
  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_ROW) {
    SequenceConfig config = read_config(stmt);
    // Drain so the statement completes before it is finalized.
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    }
    return ConfigResult::ok(std::move(config));
  }
  if (rc == SQLITE_DONE) {
    return ConfigResult::err(StorageError::kNotFound);
  }
  return ConfigResult::err(storage_error_from_rc(rc));
}

ConfigResult SqliteSequenceConfigStore::create(const SequenceConfig& config) {
  const std::string sql = std::string("INSERT INTO sequence_configs (") + kColumns +
                          ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) RETURNING " + kColumns;

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return ConfigResult::err(StorageError::kUnavailable);
  }

  stmt.bind_text(1, config.config_id.value);
  stmt.bind_text(2, config.scope.category_id.value);
  stmt.bind_text(3, subcategory_column(config.scope));
  stmt.bind_text(4, config.prefix);
  stmt.bind_text(5, config.format);
  stmt.bind_int64(6, config.starting_number);
  stmt.bind_int64(7, config.current_sequence);
  stmt.bind_int64(8, config.is_active ? 1 : 0);
  stmt.bind_text(9, config.created_by);
  stmt.bind_text(10, config.updated_by);
  stmt.bind_text(11, config.created_at);
  stmt.bind_text(12, config.updated_at);

  return step_single(stmt);
}

std::optional<SequenceConfig> SqliteSequenceConfigStore::get(const core::ConfigId& id) const {
  PreparedStatement stmt(db_->connection(), std::string("SELECT ") + kColumns +
                                                " FROM sequence_configs WHERE config_id = ?");
  if (!stmt.is_valid()) {
    return std::nullopt;
  }

  stmt.bind_text(1, id.value);

  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return read_config(stmt);
  }
  return std::nullopt;
}

std::optional<SequenceConfig> SqliteSequenceConfigStore::find_exact(
    const domain::SequenceScope& scope) const {
  PreparedStatement stmt(db_->connection(),
                         std::string("SELECT ") + kColumns +
                             " FROM sequence_configs WHERE category_id = ? AND subcategory_id = ?");
  if (!stmt.is_valid()) {
    return std::nullopt;
  }

  stmt.bind_text(1, scope.category_id.value);
  stmt.bind_text(2, subcategory_column(scope));

  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return read_config(stmt);
  }
  return std::nullopt;
}

std::vector<SequenceConfig> SqliteSequenceConfigStore::list_all() const {
  PreparedStatement stmt(db_->connection(),
                         std::string("SELECT ") + kColumns +
                             " FROM sequence_configs ORDER BY created_at DESC, config_id");
  if (!stmt.is_valid()) {
    return {};
  }

  std::vector<SequenceConfig> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    result.push_back(read_config(stmt));
  }
  return result;
}

ConfigResult SqliteSequenceConfigStore::update(const SequenceConfig& config,
                                               CounterWrite counter_write) {
  std::string sql =
      "UPDATE sequence_configs SET prefix = ?, format = ?, starting_number = ?,"
      " is_active = ?, updated_by = ?, updated_at = ?";
  if (counter_write == CounterWrite::kOverwrite) {
    sql += ", current_sequence = ?";
  }
  sql += " WHERE config_id = ? RETURNING ";
  sql += kColumns;

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return ConfigResult::err(StorageError::kUnavailable);
  }

  int index = 1;
  stmt.bind_text(index++, config.prefix);
  stmt.bind_text(index++, config.format);
  stmt.bind_int64(index++, config.starting_number);
  stmt.bind_int64(index++, config.is_active ? 1 : 0);
  stmt.bind_text(index++, config.updated_by);
  stmt.bind_text(index++, config.updated_at);
  if (counter_write == CounterWrite::kOverwrite) {
    stmt.bind_int64(index++, config.current_sequence);
  }
  stmt.bind_text(index, config.config_id.value);

  return step_single(stmt);
}

ConfigResult SqliteSequenceConfigStore::advance(const core::ConfigId& id,
                                                std::int64_t new_current_sequence) {
  PreparedStatement stmt(db_->connection(),
                         std::string("UPDATE sequence_configs SET current_sequence = ?"
                                     " WHERE config_id = ? RETURNING ") +
                             kColumns);
  if (!stmt.is_valid()) {
    return ConfigResult::err(StorageError::kUnavailable);
  }

  stmt.bind_int64(1, new_current_sequence);
  stmt.bind_text(2, id.value);

  return step_single(stmt);
}

ConfigResult SqliteSequenceConfigStore::compare_and_advance(const core::ConfigId& id,
                                                            std::int64_t expected,
                                                            std::int64_t new_current_sequence) {
  PreparedStatement stmt(db_->connection(),
                         std::string("UPDATE sequence_configs SET current_sequence = ?"
                                     " WHERE config_id = ? AND current_sequence = ? RETURNING ") +
                             kColumns);
  if (!stmt.is_valid()) {
    return ConfigResult::err(StorageError::kUnavailable);
  }

  stmt.bind_int64(1, new_current_sequence);
  stmt.bind_text(2, id.value);
  stmt.bind_int64(3, expected);

  auto result = step_single(stmt);
  if (result.has_value() || result.error() != StorageError::kNotFound) {
    return result;
  }

  // No row changed: either the config is gone or another writer moved the counter.
  if (get(id).has_value()) {
    return ConfigResult::err(StorageError::kConflict);
  }
  return result;
}

ConfigResult SqliteSequenceConfigStore::remove(const core::ConfigId& id) {
  PreparedStatement stmt(
      db_->connection(),
      std::string("DELETE FROM sequence_configs WHERE config_id = ? RETURNING ") + kColumns);
  if (!stmt.is_valid()) {
    return ConfigResult::err(StorageError::kUnavailable);
  }

  stmt.bind_text(1, id.value);

  return step_single(stmt);
}

}  // namespace mseq::storage::sqlite
