#include "mseq/domain/sequence_error.h"

namespace mseq::domain {

const char* error_code_string(const SequenceError code) {
  switch (code) {
    case SequenceError::kConfigNotFound:
      return "SEQUENCE_MANAGEMENT_NOT_FOUND";
    case SequenceError::kReferenceNotFound:
      return "CATEGORY_NOT_FOUND";
    case SequenceError::kGenerationExhausted:
      return "SEQUENCE_GENERATION_FAILED";
    case SequenceError::kDuplicateConfig:
      return "DUPLICATE_SEQUENCE_CONFIG";
    case SequenceError::kInvalidTemplate:
      return "INVALID_SEQUENCE_FORMAT";
    case SequenceError::kInvalidStartingNumber:
      return "INVALID_STARTING_NUMBER";
    case SequenceError::kInvalidPrefix:
      return "INVALID_SEQUENCE_PREFIX";
    case SequenceError::kCounterContention:
      return "SEQUENCE_COUNTER_CONTENTION";
    case SequenceError::kCancelled:
      return "SEQUENCE_GENERATION_CANCELLED";
    case SequenceError::kStorageFailure:
      return "SEQUENCE_STORAGE_ERROR";
  }
  return "SEQUENCE_STORAGE_ERROR";
}

int suggested_status(const SequenceError code) {
  switch (code) {
    case SequenceError::kConfigNotFound:
    case SequenceError::kReferenceNotFound:
      return 404;
    case SequenceError::kDuplicateConfig:
    case SequenceError::kCounterContention:
      return 409;
    case SequenceError::kInvalidTemplate:
    case SequenceError::kInvalidStartingNumber:
    case SequenceError::kInvalidPrefix:
      return 400;
    case SequenceError::kCancelled:
      return 499;
    case SequenceError::kStorageFailure:
      return 503;
    case SequenceError::kGenerationExhausted:
      return 500;
  }
  return 500;
}

SequenceFailure from_storage_error(const core::StorageError error, const std::string& context) {
  switch (error) {
    case core::StorageError::kNotFound:
      return {SequenceError::kConfigNotFound, context + ": sequence configuration not found"};
    case core::StorageError::kConflict:
      return {SequenceError::kStorageFailure, context + ": conflicting write"};
    case core::StorageError::kUnavailable:
      return {SequenceError::kStorageFailure, context + ": storage unavailable"};
  }
  return {SequenceError::kStorageFailure, context};
}

}  // namespace mseq::domain
