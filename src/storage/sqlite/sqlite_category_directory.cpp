#include "mseq/storage/sqlite/sqlite_category_directory.h"

#include <sqlite3.h>

namespace mseq::storage::sqlite {

namespace {

constexpr const char* kSelectColumns = "SELECT category_id, name, slug, parent_id, level";

domain::Category read_category(const PreparedStatement& stmt) {
  domain::Category category;
  category.category_id = core::CategoryId{stmt.column_text(0)};
  category.name = stmt.column_text(1);
  category.slug = stmt.column_text(2);
  if (auto parent = stmt.column_optional_text(3)) {
    category.parent_id = core::CategoryId{*parent};
  }
  category.level = static_cast<int>(stmt.column_int64(4));
  return category;
}

}  // namespace

SqliteCategoryDirectory::SqliteCategoryDirectory(std::shared_ptr<SqliteDb> db)
    : db_(std::move(db)) {}

core::Result<bool, core::StorageError> SqliteCategoryDirectory::upsert(
    const domain::Category& category) {
  using R = core::Result<bool, core::StorageError>;
  const char* sql = R"(
    INSERT INTO categories (category_id, name, slug, parent_id, level)
    VALUES (?, ?, ?, ?, ?)
    ON CONFLICT(category_id) DO UPDATE SET
      name = excluded.name,
      slug = excluded.slug,
      parent_id = excluded.parent_id,
      level = excluded.level
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return R::err(core::StorageError::kUnavailable);
  }

  stmt.bind_text(1, category.category_id.value);
  stmt.bind_text(2, category.name);
  stmt.bind_text(3, category.slug);
  if (category.parent_id.has_value()) {
    stmt.bind_text(4, category.parent_id->value);
  } else {
    stmt.bind_optional_text(4, std::nullopt);
  }
  stmt.bind_int64(5, category.level);

  const int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    return R::err(storage_error_from_rc(rc));
  }
  return R::ok(true);
}

std::optional<domain::Category> SqliteCategoryDirectory::get(const core::CategoryId& id) const {
  PreparedStatement stmt(db_->connection(),
                         std::string(kSelectColumns) + " FROM categories WHERE category_id = ?");
  if (!stmt.is_valid()) {
    return std::nullopt;
  }

  stmt.bind_text(1, id.value);

  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return read_category(stmt);
  }
  return std::nullopt;
}

std::vector<domain::Category> SqliteCategoryDirectory::list_all() const {
  PreparedStatement stmt(db_->connection(),
                         std::string(kSelectColumns) + " FROM categories ORDER BY category_id");
  if (!stmt.is_valid()) {
    return {};
  }

  std::vector<domain::Category> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    result.push_back(read_category(stmt));
  }
  return result;
}

}  // namespace mseq::storage::sqlite
