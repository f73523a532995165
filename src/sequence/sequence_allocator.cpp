#include "mseq/sequence/sequence_allocator.h"

#include "mseq/sequence/sequence_template.h"
#include "mseq/sequence/template_codec.h"

#include <limits>
#include <optional>

namespace mseq::sequence {

using domain::SequenceError;
using domain::SequenceFailure;

using AllocationResult = domain::SequenceResult<AllocationOutcome>;

namespace {

constexpr std::int64_t kMaxSequence = std::numeric_limits<std::int64_t>::max();

AllocationResult fail(SequenceError code, std::string message) {
  return AllocationResult::err(SequenceFailure{code, std::move(message)});
}

AllocationResult cancelled() {
  return fail(SequenceError::kCancelled, "Sequence generation cancelled before commit");
}

}  // namespace

SequenceAllocator::SequenceAllocator(storage::ISequenceConfigStore& configs,
                                     const storage::ICategoryDirectory& categories,
                                     const storage::IMachineRepository& machines,
                                     AllocatorLimits limits)
    : configs_(configs), categories_(categories), machines_(machines), limits_(limits) {}

AllocationResult SequenceAllocator::generate(const domain::SequenceScope& scope,
                                             std::stop_token stop) const {
  auto config = storage::resolve_config(configs_, scope);
  if (!config.has_value()) {
    return fail(SequenceError::kConfigNotFound,
                "No active sequence configuration for " + domain::scope_to_string(scope));
  }

  const auto category = categories_.get(scope.category_id);
  if (!category.has_value()) {
    return fail(SequenceError::kReferenceNotFound,
                "Category not found: " + scope.category_id.value);
  }

  std::string subcategory_slug;
  if (scope.subcategory_id.has_value()) {
    const auto subcategory = categories_.get(*scope.subcategory_id);
    if (!subcategory.has_value()) {
      return fail(SequenceError::kReferenceNotFound,
                  "Subcategory not found: " + scope.subcategory_id->value);
    }
    subcategory_slug = subcategory->slug;
  }

  int collisions = 0;
  for (int round = 0; round <= limits_.max_commit_retries; ++round) {
    auto tmpl = SequenceTemplate::parse(config->format);
    if (!tmpl.has_value()) {
      return AllocationResult::err(tmpl.error());
    }

    const std::int64_t base = config->current_sequence;
    if (base == kMaxSequence) {
      return fail(SequenceError::kGenerationExhausted,
                  "Sequence counter for " + domain::scope_to_string(scope) +
                      " has reached its maximum value");
    }
    std::int64_t candidate = base + 1;
    std::optional<std::string> accepted;

    for (int attempt = 0; attempt < limits_.max_attempts; ++attempt) {
      if (stop.stop_requested()) {
        return cancelled();
      }
      std::string identifier = encode(tmpl.value(), category->slug, subcategory_slug, candidate);
      if (!machines_.exists_live_with_identifier(identifier)) {
        accepted = std::move(identifier);
        break;
      }
      ++collisions;
      if (candidate == kMaxSequence) {
        break;
      }
      ++candidate;
    }

    if (!accepted.has_value()) {
      return fail(SequenceError::kGenerationExhausted,
                  "Unable to generate unique sequence after " +
                      std::to_string(limits_.max_attempts) + " attempts for " +
                      domain::scope_to_string(scope));
    }

    if (stop.stop_requested()) {
      return cancelled();
    }

    auto committed = configs_.compare_and_advance(config->config_id, base, candidate);
    if (committed.has_value()) {
      return AllocationResult::ok(
          AllocationOutcome{std::move(*accepted), candidate, config->config_id, collisions});
    }

    if (committed.error() != core::StorageError::kConflict) {
      return AllocationResult::err(
          domain::from_storage_error(committed.error(), "Sequence counter update"));
    }

    // Another allocator moved the counter; continue from its value.
    config = configs_.get(config->config_id);
    if (!config.has_value() || !config->is_active) {
      return fail(SequenceError::kConfigNotFound,
                  "Sequence configuration vanished during generation for " +
                      domain::scope_to_string(scope));
    }
  }

  return fail(SequenceError::kCounterContention,
              "Sequence counter for " + domain::scope_to_string(scope) + " changed " +
                  std::to_string(limits_.max_commit_retries + 1) + " times during generation");
}

}  // namespace mseq::sequence
