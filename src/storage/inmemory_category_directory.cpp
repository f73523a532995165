#include "mseq/storage/inmemory_category_directory.h"

namespace mseq::storage {

core::Result<bool, core::StorageError> InMemoryCategoryDirectory::upsert(
    const domain::Category& category) {
  categories_[category.category_id] = category;
  return core::Result<bool, core::StorageError>::ok(true);
}

std::optional<domain::Category> InMemoryCategoryDirectory::get(const core::CategoryId& id) const {
  auto it = categories_.find(id);
  if (it != categories_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::vector<domain::Category> InMemoryCategoryDirectory::list_all() const {
  std::vector<domain::Category> result;
  result.reserve(categories_.size());
  for (const auto& [id, category] : categories_) {
    result.push_back(category);
  }
  return result;
}

}  // namespace mseq::storage
