#pragma once

#include "mseq/storage/repositories.h"

#include <map>

namespace mseq::storage {

// InMemoryCategoryDirectory stores Categories in a std::map for deterministic
// iteration order (sorted by CategoryId).
class InMemoryCategoryDirectory final : public ICategoryDirectory {
 public:
  core::Result<bool, core::StorageError> upsert(const domain::Category& category) override;
  [[nodiscard]] std::optional<domain::Category> get(const core::CategoryId& id) const override;
  [[nodiscard]] std::vector<domain::Category> list_all() const override;

 private:
  std::map<core::CategoryId, domain::Category> categories_;
};

}  // namespace mseq::storage
