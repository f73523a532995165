#pragma once

#include "mseq/core/ids.h"

#include <optional>
#include <string>

namespace mseq::domain {

// Machine carries the identifier (machine_sequence) issued by the allocator.
// A machine is live until deleted_at is set; only live machines take part in
// identifier uniqueness.
struct Machine {
  core::MachineId machine_id;
  std::string name;
  core::CategoryId category_id;
  std::optional<core::CategoryId> subcategory_id;
  std::string machine_sequence;
  std::optional<std::string> deleted_at;

  [[nodiscard]] bool is_live() const { return !deleted_at.has_value(); }
};

// MachineRef is the projection the reformat migrator works on.
struct MachineRef {
  core::MachineId machine_id;
  std::string identifier;
};

}  // namespace mseq::domain
