#include "mseq/storage/sequence_config_store.h"

#include <algorithm>

namespace mseq::storage {

std::optional<domain::SequenceConfig> resolve_config(const ISequenceConfigStore& store,
                                                     const domain::SequenceScope& scope) {
  auto exact = store.find_exact(scope);
  if (exact.has_value() && exact->is_active) {
    return exact;
  }

  if (scope.is_category_wide()) {
    return std::nullopt;
  }

  auto fallback = store.find_exact(scope.category_wide());
  if (fallback.has_value() && fallback->is_active) {
    return fallback;
  }
  return std::nullopt;
}

void sort_newest_first(std::vector<domain::SequenceConfig>& configs) {
  std::sort(configs.begin(), configs.end(),
            [](const domain::SequenceConfig& a, const domain::SequenceConfig& b) {
              if (a.created_at != b.created_at) {
                return a.created_at > b.created_at;
              }
              return a.config_id.value < b.config_id.value;
            });
}

}  // namespace mseq::storage
