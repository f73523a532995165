#pragma once

#include "mseq/domain/sequence_error.h"
#include "mseq/domain/sequence_scope.h"
#include "mseq/sequence/sequence_decoder.h"
#include "mseq/storage/repositories.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mseq::sequence {

enum class ReformatOutcome {
  kUpdated,      // re-rendered (or would be, in a dry run)
  kUnchanged,    // new rendering equals the stored identifier
  kUndecodable,  // no decode rule recovered a number
  kFailed,       // target identifier taken, or the write failed
};

[[nodiscard]] const char* reformat_outcome_name(ReformatOutcome outcome);

struct ReformatItem {
  core::MachineId machine_id;
  std::string old_identifier;
  std::optional<std::string> new_identifier;
  ReformatOutcome outcome{ReformatOutcome::kUnchanged};
  std::optional<DecodeStrategy> strategy;  // rule that recovered the number
  std::string reason;                      // set for kUndecodable and kFailed
};

struct ReformatReport {
  std::size_t updated{0};
  std::size_t unchanged{0};
  std::size_t undecodable{0};
  std::size_t failed{0};
  bool dry_run{false};
  std::vector<ReformatItem> items;
};

struct ReformatRequest {
  domain::SequenceScope scope;
  std::string old_format;
  std::string new_format;
  bool dry_run{false};
};

// ReformatMigrator re-renders the identifiers of every live machine in a scope
// after a template change. It never runs implicitly; callers opt in.
//
// Phases:
//   1. Plan: decode each identifier with the old template, encode with the new one.
//   2. Check: a planned identifier is rejected if two machines in the batch
//      would land on it, or if a live machine holds it and is not itself
//      moving away in this batch. Rejections can strand other targets, so
//      the check repeats until stable. Machines trading identifiers in a
//      cycle are rejected.
//   3. Apply: a machine freeing an identifier is written before the machine
//      taking it. A failed write is recorded and fails any machine waiting on
//      it; the batch continues and nothing is rolled back.
//
// Re-running with the same template pair is a no-op: every identifier is
// already in its new form and lands in kUnchanged.
class ReformatMigrator {
 public:
  ReformatMigrator(const storage::ICategoryDirectory& categories,
                   storage::IMachineRepository& machines);

  [[nodiscard]] domain::SequenceResult<ReformatReport> run(const ReformatRequest& request);

 private:
  const storage::ICategoryDirectory& categories_;
  storage::IMachineRepository& machines_;
};

}  // namespace mseq::sequence
