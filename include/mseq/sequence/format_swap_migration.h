#pragma once

#include "mseq/core/clock.h"
#include "mseq/storage/sequence_config_store.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mseq::sequence {

// swap_category_and_sequence exchanges the first {category} and the first
// {sequence} when {category} comes first, keeping the text before, between and
// after them: "{category}-{sequence}" -> "{sequence}-{category}".
// Returns nullopt when either token is missing or {sequence} already leads.
[[nodiscard]] std::optional<std::string> swap_category_and_sequence(const std::string& format);

struct FormatSwapItem {
  core::ConfigId config_id;
  std::string old_format;
  std::optional<std::string> new_format;  // nullopt when skipped
  std::string error;                      // set when the write failed
};

struct FormatSwapReport {
  std::size_t updated{0};
  std::size_t skipped{0};
  std::size_t failed{0};
  bool preview{false};
  std::vector<FormatSwapItem> items;
};

// FormatSwapMigration moves every config from category-first to sequence-first
// rendering. Counters are untouched and existing identifiers keep their form;
// only identifiers issued afterwards use the new template. Machines are
// re-rendered separately through a reformat when wanted.
class FormatSwapMigration {
 public:
  FormatSwapMigration(storage::ISequenceConfigStore& store, core::IClock& clock);

  // preview=true computes the report without writing.
  [[nodiscard]] FormatSwapReport run(bool preview, const std::string& updated_by);

 private:
  storage::ISequenceConfigStore& store_;
  core::IClock& clock_;
};

}  // namespace mseq::sequence
