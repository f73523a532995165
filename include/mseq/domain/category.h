#pragma once

#include "mseq/core/ids.h"

#include <optional>
#include <string>

namespace mseq::domain {

// Category is the read-only view the sequence engine needs of the category tree.
// level 0 is a top-level category; subcategories carry their parent's id.
struct Category {
  core::CategoryId category_id;
  std::string name;
  std::string slug;
  std::optional<core::CategoryId> parent_id;
  int level{0};
};

}  // namespace mseq::domain
