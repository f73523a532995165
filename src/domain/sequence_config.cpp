#include "mseq/domain/sequence_config.h"

#include <cctype>

namespace mseq::domain {

std::string normalize_prefix(const std::string& prefix) {
  std::string out = prefix;
  for (char& c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

SequenceResult<bool> validate_prefix(const std::string& prefix) {
  if (prefix.empty() || prefix.size() > kMaxPrefixLength) {
    return SequenceResult<bool>::err(
        {SequenceError::kInvalidPrefix, "Sequence prefix must be 1 to 10 characters"});
  }
  for (const char c : prefix) {
    const bool upper = c >= 'A' && c <= 'Z';
    const bool digit = c >= '0' && c <= '9';
    if (!upper && !digit && c != '-') {
      return SequenceResult<bool>::err(
          {SequenceError::kInvalidPrefix,
           "Sequence prefix can only contain uppercase letters, numbers, and hyphens"});
    }
  }
  return SequenceResult<bool>::ok(true);
}

SequenceResult<bool> validate_starting_number(const std::int64_t starting_number) {
  if (starting_number < 1) {
    return SequenceResult<bool>::err(
        {SequenceError::kInvalidStartingNumber, "Starting number must be at least 1"});
  }
  return SequenceResult<bool>::ok(true);
}

}  // namespace mseq::domain
