#include "mseq/sequence/template_codec.h"

#include <cctype>

namespace mseq::sequence {

std::string pad_sequence(const std::int64_t number) {
  std::string digits = std::to_string(number);
  if (digits.size() < kSequencePadWidth) {
    digits.insert(0, kSequencePadWidth - digits.size(), '0');
  }
  return digits;
}

std::string collapse_hyphens(const std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    if (c == '-' && !out.empty() && out.back() == '-') {
      continue;
    }
    out.push_back(c);
  }
  if (!out.empty() && out.front() == '-') {
    out.erase(0, 1);
  }
  if (!out.empty() && out.back() == '-') {
    out.pop_back();
  }
  return out;
}

std::string to_upper_ascii(const std::string_view text) {
  std::string out(text);
  for (char& c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

std::string encode(const SequenceTemplate& tmpl, const std::string_view category_slug,
                   const std::string_view subcategory_slug, const std::int64_t number) {
  const std::string category = to_upper_ascii(category_slug);
  const std::string subcategory = to_upper_ascii(subcategory_slug);
  const std::string padded = pad_sequence(number);

  std::string rendered;
  for (const auto& segment : tmpl.segments()) {
    switch (segment.kind) {
      case SegmentKind::kLiteral:
        rendered += segment.text;
        break;
      case SegmentKind::kCategory:
        rendered += category;
        break;
      case SegmentKind::kSubcategory:
        rendered += subcategory;
        break;
      case SegmentKind::kSequence:
        rendered += padded;
        break;
    }
  }
  return collapse_hyphens(rendered);
}

std::string encode(const std::string& format, const std::string_view category_slug,
                   const std::string_view subcategory_slug, const std::int64_t number) {
  return encode(SequenceTemplate::parse_lenient(format), category_slug, subcategory_slug, number);
}

}  // namespace mseq::sequence
