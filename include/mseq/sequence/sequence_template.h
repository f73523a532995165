#pragma once

#include "mseq/domain/sequence_error.h"

#include <cstddef>
#include <string>
#include <vector>

namespace mseq::sequence {

// Placeholders understood by the template grammar. Any other text, including
// unknown "{...}" tokens, is literal.
inline constexpr const char* kCategoryToken = "{category}";
inline constexpr const char* kSubcategoryToken = "{subcategory}";
inline constexpr const char* kSequenceToken = "{sequence}";

// Sequence numbers are zero-padded to at least this many digits.
inline constexpr std::size_t kSequencePadWidth = 3;

enum class SegmentKind {
  kLiteral,
  kCategory,
  kSubcategory,
  kSequence,
};

struct TemplateSegment {
  SegmentKind kind{SegmentKind::kLiteral};
  std::string text;  // literal text; empty for tokens

  bool operator==(const TemplateSegment&) const = default;
};

// SequenceTemplate is a format string parsed once into typed segments.
// parse() enforces the grammar (both {category} and {sequence} present) and is
// used for every template the config manager accepts. parse_lenient() accepts
// anything and exists for historical templates read back during a reformat.
class SequenceTemplate {
 public:
  [[nodiscard]] static domain::SequenceResult<SequenceTemplate> parse(const std::string& format);
  [[nodiscard]] static SequenceTemplate parse_lenient(const std::string& format);

  [[nodiscard]] const std::string& source() const { return source_; }
  [[nodiscard]] const std::vector<TemplateSegment>& segments() const { return segments_; }

  [[nodiscard]] bool has_token(SegmentKind kind) const;

  // Index of the first segment of the given kind, or segments().size() if absent.
  [[nodiscard]] std::size_t first_index_of(SegmentKind kind) const;

 private:
  SequenceTemplate(std::string source, std::vector<TemplateSegment> segments)
      : source_(std::move(source)), segments_(std::move(segments)) {}

  std::string source_;
  std::vector<TemplateSegment> segments_;
};

}  // namespace mseq::sequence
