#pragma once

#include "mseq/core/ids.h"
#include "mseq/domain/sequence_error.h"
#include "mseq/domain/sequence_scope.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace mseq::domain {

// SequenceConfig is the persisted counter record for one scope.
// Invariants:
// - starting_number >= 1
// - current_sequence >= starting_number - 1 (last number actually issued)
// - prefix is 1-10 chars of [A-Z0-9-]
// - format contains {category} and {sequence}
struct SequenceConfig {
  core::ConfigId config_id;
  SequenceScope scope;
  std::string prefix;
  std::string format;
  std::int64_t starting_number{1};
  std::int64_t current_sequence{0};
  bool is_active{true};

  std::string created_by;
  std::string updated_by;
  std::string created_at;
  std::string updated_at;
};

inline constexpr std::size_t kMaxPrefixLength = 10;

// Uppercases ASCII letters; other characters are kept as-is.
[[nodiscard]] std::string normalize_prefix(const std::string& prefix);

// Checks the prefix rule on an already normalized prefix.
[[nodiscard]] SequenceResult<bool> validate_prefix(const std::string& prefix);

[[nodiscard]] SequenceResult<bool> validate_starting_number(std::int64_t starting_number);

}  // namespace mseq::domain
