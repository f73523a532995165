#include "mseq/storage/sqlite/sqlite_db.h"
#include "mseq/storage/sqlite/sqlite_sequence_config_store.h"

#include <catch2/catch_test_macros.hpp>

using namespace mseq;
using core::StorageError;

namespace {

std::shared_ptr<storage::sqlite::SqliteDb> open_db() {
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();
  REQUIRE(db->ensure_schema_v1().has_value());
  return db;
}

domain::SequenceConfig make_config(const std::string& id, std::optional<core::CategoryId> sub,
                                   const std::string& created_at = "2026-01-01T00:00:00Z") {
  domain::SequenceConfig config;
  config.config_id = core::ConfigId{id};
  config.scope = {core::CategoryId{"cat-srv"}, std::move(sub)};
  config.prefix = "SRV";
  config.format = "{category}-{subcategory}-{sequence}";
  config.starting_number = 100;
  config.current_sequence = 99;
  config.created_by = "alice";
  config.updated_by = "alice";
  config.created_at = created_at;
  config.updated_at = created_at;
  return config;
}

}  // namespace

TEST_CASE("SqliteSequenceConfigStore: create and read back", "[sqlite][config]") {
  auto db = open_db();
  storage::sqlite::SqliteSequenceConfigStore store(db);

  const auto created = store.create(make_config("cfg-1", std::nullopt));
  REQUIRE(created.has_value());
  CHECK(created.value().prefix == "SRV");
  CHECK(created.value().current_sequence == 99);

  auto loaded = store.get(core::ConfigId{"cfg-1"});
  REQUIRE(loaded.has_value());
  CHECK(loaded->scope.is_category_wide());
  CHECK(loaded->format == "{category}-{subcategory}-{sequence}");
  CHECK(loaded->starting_number == 100);
  CHECK(loaded->is_active);
  CHECK(loaded->created_by == "alice");

  CHECK_FALSE(store.get(core::ConfigId{"cfg-missing"}).has_value());
}

TEST_CASE("SqliteSequenceConfigStore: scope uniqueness", "[sqlite][config]") {
  auto db = open_db();
  storage::sqlite::SqliteSequenceConfigStore store(db);
  const core::CategoryId web{"cat-web"};

  REQUIRE(store.create(make_config("cfg-wide", std::nullopt)).has_value());
  REQUIRE(store.create(make_config("cfg-web", web)).has_value());

  SECTION("a second category-wide config conflicts") {
    const auto dup = store.create(make_config("cfg-wide-2", std::nullopt));
    REQUIRE_FALSE(dup.has_value());
    CHECK(dup.error() == StorageError::kConflict);
  }

  SECTION("a second subcategory config conflicts") {
    const auto dup = store.create(make_config("cfg-web-2", web));
    REQUIRE_FALSE(dup.has_value());
    CHECK(dup.error() == StorageError::kConflict);
  }

  SECTION("find_exact keeps the two scopes apart") {
    auto wide = store.find_exact({core::CategoryId{"cat-srv"}, std::nullopt});
    auto sub = store.find_exact({core::CategoryId{"cat-srv"}, web});
    REQUIRE(wide.has_value());
    REQUIRE(sub.has_value());
    CHECK(wide->config_id.value == "cfg-wide");
    CHECK(sub->config_id.value == "cfg-web");
    CHECK(sub->scope.subcategory_id == std::optional<core::CategoryId>(web));
  }
}

TEST_CASE("SqliteSequenceConfigStore: compare_and_advance", "[sqlite][config]") {
  auto db = open_db();
  storage::sqlite::SqliteSequenceConfigStore store(db);
  REQUIRE(store.create(make_config("cfg-1", std::nullopt)).has_value());
  const core::ConfigId id{"cfg-1"};

  const auto advanced = store.compare_and_advance(id, 99, 100);
  REQUIRE(advanced.has_value());
  CHECK(advanced.value().current_sequence == 100);

  const auto stale = store.compare_and_advance(id, 99, 101);
  REQUIRE_FALSE(stale.has_value());
  CHECK(stale.error() == StorageError::kConflict);
  CHECK(store.get(id)->current_sequence == 100);

  const auto missing = store.compare_and_advance(core::ConfigId{"cfg-x"}, 0, 1);
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error() == StorageError::kNotFound);
}

TEST_CASE("SqliteSequenceConfigStore: update, advance and remove", "[sqlite][config]") {
  auto db = open_db();
  storage::sqlite::SqliteSequenceConfigStore store(db);
  REQUIRE(store.create(make_config("cfg-1", std::nullopt)).has_value());
  const core::ConfigId id{"cfg-1"};
  REQUIRE(store.advance(id, 150).has_value());

  auto next = make_config("cfg-1", std::nullopt);
  next.prefix = "HOST";
  next.is_active = false;
  next.current_sequence = 0;
  next.updated_by = "bob";
  next.updated_at = "2026-03-01T00:00:00Z";

  const auto kept = store.update(next, storage::CounterWrite::kKeep);
  REQUIRE(kept.has_value());
  CHECK(kept.value().prefix == "HOST");
  CHECK_FALSE(kept.value().is_active);
  CHECK(kept.value().current_sequence == 150);
  CHECK(kept.value().created_by == "alice");
  CHECK(kept.value().updated_by == "bob");

  const auto overwritten = store.update(next, storage::CounterWrite::kOverwrite);
  REQUIRE(overwritten.has_value());
  CHECK(overwritten.value().current_sequence == 0);

  CHECK(store.advance(core::ConfigId{"cfg-x"}, 1).error() == StorageError::kNotFound);

  const auto removed = store.remove(id);
  REQUIRE(removed.has_value());
  CHECK(removed.value().prefix == "HOST");
  CHECK_FALSE(store.get(id).has_value());
  CHECK(store.remove(id).error() == StorageError::kNotFound);
}

TEST_CASE("SqliteSequenceConfigStore: list_all is newest first", "[sqlite][config]") {
  auto db = open_db();
  storage::sqlite::SqliteSequenceConfigStore store(db);

  REQUIRE(store.create(make_config("cfg-b", std::nullopt, "2026-01-01T00:00:00Z")).has_value());
  REQUIRE(store.create(make_config("cfg-c", core::CategoryId{"cat-web"}, "2026-02-01T00:00:00Z"))
              .has_value());
  REQUIRE(store.create(make_config("cfg-a", core::CategoryId{"cat-db"}, "2026-02-01T00:00:00Z"))
              .has_value());

  const auto all = store.list_all();
  REQUIRE(all.size() == 3);
  CHECK(all[0].config_id.value == "cfg-a");
  CHECK(all[1].config_id.value == "cfg-c");
  CHECK(all[2].config_id.value == "cfg-b");
}

TEST_CASE("SqliteSequenceConfigStore: counters survive reopening a store", "[sqlite][config]") {
  auto db = open_db();
  {
    storage::sqlite::SqliteSequenceConfigStore store(db);
    REQUIRE(store.create(make_config("cfg-1", std::nullopt)).has_value());
    REQUIRE(store.compare_and_advance(core::ConfigId{"cfg-1"}, 99, 104).has_value());
  }

  storage::sqlite::SqliteSequenceConfigStore reopened(db);
  CHECK(reopened.get(core::ConfigId{"cfg-1"})->current_sequence == 104);
}
