#pragma once

#include "mseq/domain/sequence_error.h"
#include "mseq/domain/sequence_scope.h"
#include "mseq/storage/repositories.h"
#include "mseq/storage/sequence_config_store.h"

#include <cstdint>
#include <stop_token>
#include <string>

namespace mseq::sequence {

struct AllocatorLimits {
  // Identifiers probed per commit attempt before giving up with kGenerationExhausted.
  int max_attempts{1000};
  // Lost compare-and-swap rounds before giving up with kCounterContention.
  int max_commit_retries{16};
};

struct AllocationOutcome {
  std::string identifier;
  std::int64_t number{0};
  core::ConfigId config_id;  // config that issued the number (may be the category-wide fallback)
  int collisions_skipped{0};
};

// SequenceAllocator issues the next collision-free identifier for a scope.
//
// Flow per commit attempt:
//   1. Read the resolved config; N = current_sequence.
//   2. Probe N+1, N+2, ... against the machine repository until an identifier is
//      free among live machines (at most max_attempts probes).
//   3. compare_and_advance(config, N, accepted). A lost swap means another
//      allocator claimed numbers in the meantime: re-read and start over.
//
// The swap is the only write. Cancellation is checked before every probe and
// before the commit, so a cancelled request leaves the counter untouched.
//
// The subcategory slug comes from the requested scope even when the config is
// the category-wide fallback, so identifiers still carry the subcategory.
class SequenceAllocator {
 public:
  SequenceAllocator(storage::ISequenceConfigStore& configs,
                    const storage::ICategoryDirectory& categories,
                    const storage::IMachineRepository& machines, AllocatorLimits limits = {});

  [[nodiscard]] domain::SequenceResult<AllocationOutcome> generate(
      const domain::SequenceScope& scope, std::stop_token stop = {}) const;

 private:
  storage::ISequenceConfigStore& configs_;
  const storage::ICategoryDirectory& categories_;
  const storage::IMachineRepository& machines_;
  AllocatorLimits limits_;
};

}  // namespace mseq::sequence
