#include "mseq/sequence/format_swap_migration.h"

#include "mseq/sequence/sequence_template.h"

#include <string_view>

namespace mseq::sequence {

std::optional<std::string> swap_category_and_sequence(const std::string& format) {
  const std::string_view category_token{kCategoryToken};
  const std::string_view sequence_token{kSequenceToken};

  const auto category_pos = format.find(category_token);
  const auto sequence_pos = format.find(sequence_token);
  if (category_pos == std::string::npos || sequence_pos == std::string::npos ||
      category_pos > sequence_pos) {
    return std::nullopt;
  }

  const std::size_t between_start = category_pos + category_token.size();
  std::string swapped = format.substr(0, category_pos);
  swapped += sequence_token;
  swapped += format.substr(between_start, sequence_pos - between_start);
  swapped += category_token;
  swapped += format.substr(sequence_pos + sequence_token.size());
  return swapped;
}

FormatSwapMigration::FormatSwapMigration(storage::ISequenceConfigStore& store,
                                         core::IClock& clock)
    : store_(store), clock_(clock) {}

FormatSwapReport FormatSwapMigration::run(bool preview, const std::string& updated_by) {
  FormatSwapReport report;
  report.preview = preview;

  for (const auto& config : store_.list_all()) {
    FormatSwapItem item{config.config_id, config.format, swap_category_and_sequence(config.format),
                        ""};
    if (!item.new_format.has_value()) {
      ++report.skipped;
      report.items.push_back(std::move(item));
      continue;
    }

    if (!preview) {
      domain::SequenceConfig next = config;
      next.format = *item.new_format;
      next.updated_by = updated_by;
      next.updated_at = clock_.now_iso8601();

      auto stored = store_.update(next, storage::CounterWrite::kKeep);
      if (!stored.has_value()) {
        item.error = domain::from_storage_error(stored.error(), "Update sequence format").message;
        ++report.failed;
        report.items.push_back(std::move(item));
        continue;
      }
    }

    ++report.updated;
    report.items.push_back(std::move(item));
  }

  return report;
}

}  // namespace mseq::sequence
