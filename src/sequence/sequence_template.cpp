#include "mseq/sequence/sequence_template.h"

#include <array>
#include <string_view>
#include <utility>

namespace mseq::sequence {

namespace {

struct TokenSpelling {
  std::string_view text;
  SegmentKind kind;
};

constexpr std::array<TokenSpelling, 3> kTokens{{
    {kCategoryToken, SegmentKind::kCategory},
    {kSubcategoryToken, SegmentKind::kSubcategory},
    {kSequenceToken, SegmentKind::kSequence},
}};

std::vector<TemplateSegment> split_segments(const std::string& format) {
  std::vector<TemplateSegment> segments;
  const std::string_view view{format};

  auto append_literal = [&segments](char c) {
    if (segments.empty() || segments.back().kind != SegmentKind::kLiteral) {
      segments.push_back(TemplateSegment{SegmentKind::kLiteral, ""});
    }
    segments.back().text.push_back(c);
  };

  std::size_t i = 0;
  while (i < view.size()) {
    bool matched = false;
    if (view[i] == '{') {
      for (const auto& token : kTokens) {
        if (view.substr(i).starts_with(token.text)) {
          segments.push_back(TemplateSegment{token.kind, ""});
          i += token.text.size();
          matched = true;
          break;
        }
      }
    }
    if (!matched) {
      append_literal(view[i]);
      ++i;
    }
  }
  return segments;
}

}  // namespace

domain::SequenceResult<SequenceTemplate> SequenceTemplate::parse(const std::string& format) {
  auto parsed = parse_lenient(format);
  if (!parsed.has_token(SegmentKind::kCategory) || !parsed.has_token(SegmentKind::kSequence)) {
    return domain::SequenceResult<SequenceTemplate>::err(
        {domain::SequenceError::kInvalidTemplate,
         "Sequence format must contain {category} and {sequence} placeholders"});
  }
  return domain::SequenceResult<SequenceTemplate>::ok(std::move(parsed));
}

SequenceTemplate SequenceTemplate::parse_lenient(const std::string& format) {
  return SequenceTemplate(format, split_segments(format));
}

bool SequenceTemplate::has_token(const SegmentKind kind) const {
  return first_index_of(kind) != segments_.size();
}

std::size_t SequenceTemplate::first_index_of(const SegmentKind kind) const {
  for (std::size_t i = 0; i < segments_.size(); ++i) {
    if (segments_[i].kind == kind) {
      return i;
    }
  }
  return segments_.size();
}

}  // namespace mseq::sequence
