#pragma once

#ifdef MSEQ_TRANSPORT_BOUNDARY_GUARD
#error "Concrete storage/redis header included in a guarded translation unit; use interfaces only."
#endif

#include "mseq/storage/sequence_config_store.h"
#include "mseq/storage/sqlite/sqlite_db.h"

#include <memory>

namespace mseq::storage::sqlite {

// SqliteSequenceConfigStore implements ISequenceConfigStore with SQLite backend.
// Every write is one statement with a RETURNING clause, so the record handed
// back is the row exactly as that statement left it. compare_and_advance is a
// conditional UPDATE on current_sequence; SQLite serializes writers, which
// makes it safe across processes sharing the database file.
class SqliteSequenceConfigStore final : public ISequenceConfigStore {
 public:
  explicit SqliteSequenceConfigStore(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::Result<domain::SequenceConfig, core::StorageError> create(
      const domain::SequenceConfig& config) override;
  [[nodiscard]] std::optional<domain::SequenceConfig> get(
      const core::ConfigId& id) const override;
  [[nodiscard]] std::optional<domain::SequenceConfig> find_exact(
      const domain::SequenceScope& scope) const override;
  [[nodiscard]] std::vector<domain::SequenceConfig> list_all() const override;
  [[nodiscard]] core::Result<domain::SequenceConfig, core::StorageError> update(
      const domain::SequenceConfig& config, CounterWrite counter_write) override;
  [[nodiscard]] core::Result<domain::SequenceConfig, core::StorageError> advance(
      const core::ConfigId& id, std::int64_t new_current_sequence) override;
  [[nodiscard]] core::Result<domain::SequenceConfig, core::StorageError> compare_and_advance(
      const core::ConfigId& id, std::int64_t expected,
      std::int64_t new_current_sequence) override;
  [[nodiscard]] core::Result<domain::SequenceConfig, core::StorageError> remove(
      const core::ConfigId& id) override;

 private:
  std::shared_ptr<SqliteDb> db_;

  // Steps a statement expected to return at most one config row.
  // No row maps to kNotFound.
  [[nodiscard]] core::Result<domain::SequenceConfig, core::StorageError> step_single(
      PreparedStatement& stmt) const;
};

}  // namespace mseq::storage::sqlite
