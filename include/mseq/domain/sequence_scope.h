#pragma once

#include "mseq/core/ids.h"

#include <optional>
#include <string>

namespace mseq::domain {

// SequenceScope identifies a counter: a category and an optional subcategory.
// A scope without subcategory is category-wide and serves as the fallback for any
// subcategory of that category that has no dedicated counter.
struct SequenceScope {
  core::CategoryId category_id;
  std::optional<core::CategoryId> subcategory_id;

  bool operator==(const SequenceScope&) const = default;

  [[nodiscard]] bool is_category_wide() const { return !subcategory_id.has_value(); }

  // Same category, no subcategory.
  [[nodiscard]] SequenceScope category_wide() const { return SequenceScope{category_id, {}}; }
};

// Human-readable form used in log lines and audit payloads: "cat" or "cat/sub".
[[nodiscard]] std::string scope_to_string(const SequenceScope& scope);

}  // namespace mseq::domain
