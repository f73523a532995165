#pragma once

#include "mseq/sequence/sequence_template.h"

#include <array>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace mseq::sequence {

// DecodeStrategy names one reverse-parsing rule. Rules are tried in kDecodeOrder
// and the first that yields a number wins.
enum class DecodeStrategy {
  kStructural,        // regex rebuilt from the old template with known slugs
  kPaddedNumber,      // zero-padded number of at least 3 significant digits
  kZeroPaddedNumber,  // any zero-padded number
  kBareDigits,        // last digit run of length >= 2, else last digit run
};

inline constexpr std::array<DecodeStrategy, 4> kDecodeOrder{
    DecodeStrategy::kStructural,
    DecodeStrategy::kPaddedNumber,
    DecodeStrategy::kZeroPaddedNumber,
    DecodeStrategy::kBareDigits,
};

// DecodeContext carries the slugs the identifier was rendered with.
// subcategory_slug:
//   - a value (possibly "") when the subcategory is known; "" means "no subcategory"
//   - nullopt when unknown, in which case {subcategory} matches [A-Z0-9-]*
struct DecodeContext {
  std::string category_slug;
  std::optional<std::string> subcategory_slug;
};

struct DecodeResult {
  std::int64_t number{0};
  DecodeStrategy strategy{DecodeStrategy::kStructural};
};

[[nodiscard]] const char* strategy_name(DecodeStrategy strategy);

// Decoder bound to one old template and its slugs. The structural patterns are
// compiled on construction, so a batch builds them once for all identifiers.
class SequenceDecoder {
 public:
  SequenceDecoder(const SequenceTemplate& old_template, const DecodeContext& context);

  // Runs a single rule. Never throws; regex failures yield nullopt.
  [[nodiscard]] std::optional<std::int64_t> decode_with(DecodeStrategy strategy,
                                                        std::string_view identifier) const;

  // First rule of kDecodeOrder that yields a number.
  [[nodiscard]] std::optional<DecodeResult> decode(std::string_view identifier) const;

 private:
  struct CompiledSkeleton {
    std::regex pattern;
    std::size_t sequence_group{0};
  };

  [[nodiscard]] std::optional<std::int64_t> decode_structural(std::string_view identifier) const;

  std::optional<CompiledSkeleton> known_slugs_;       // every slug rendered literally
  std::optional<CompiledSkeleton> open_subcategory_;  // {subcategory} as [A-Z0-9-]*
};

// One-shot forms of SequenceDecoder.
[[nodiscard]] std::optional<std::int64_t> decode_with(DecodeStrategy strategy,
                                                      std::string_view identifier,
                                                      const SequenceTemplate& old_template,
                                                      const DecodeContext& context);

// Recovers the number embedded in an identifier produced by old_template.
// nullopt means "not found": callers skip the item, they never fail the batch.
[[nodiscard]] std::optional<DecodeResult> decode(std::string_view identifier,
                                                 const SequenceTemplate& old_template,
                                                 const DecodeContext& context);

[[nodiscard]] std::optional<DecodeResult> decode(std::string_view identifier,
                                                 const std::string& old_format,
                                                 const DecodeContext& context);

}  // namespace mseq::sequence
