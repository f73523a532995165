#pragma once

#include "mseq/core/result.h"

#include <string>

namespace mseq::domain {

// SequenceError is the typed failure taxonomy of the sequence engine.
// Callers (HTTP layers, CLIs) switch on the code; they never parse messages.
enum class SequenceError {
  kConfigNotFound,         // no counter for scope, nor a usable fallback
  kReferenceNotFound,      // category or subcategory vanished
  kGenerationExhausted,    // collision retries used up
  kDuplicateConfig,        // config already exists for the exact scope
  kInvalidTemplate,        // template lacks {category} or {sequence}
  kInvalidStartingNumber,  // starting number < 1
  kInvalidPrefix,          // prefix not 1-10 chars of [A-Z0-9-]
  kCounterContention,      // compare-and-swap on the counter kept losing
  kCancelled,              // enclosing request cancelled before commit
  kStorageFailure,         // backend unavailable or rejected the write
};

struct SequenceFailure {
  SequenceError code;
  std::string message;
};

template <typename T>
using SequenceResult = core::Result<T, SequenceFailure>;

// Stable machine-readable code, e.g. "SEQUENCE_MANAGEMENT_NOT_FOUND".
[[nodiscard]] const char* error_code_string(SequenceError code);

// HTTP-style status a transport collaborator should map the failure to.
[[nodiscard]] int suggested_status(SequenceError code);

// Translate a storage failure into the engine taxonomy. kNotFound becomes
// kConfigNotFound; everything else is a storage failure.
[[nodiscard]] SequenceFailure from_storage_error(core::StorageError error,
                                                 const std::string& context);

}  // namespace mseq::domain
