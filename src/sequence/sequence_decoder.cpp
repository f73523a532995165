#include "mseq/sequence/sequence_decoder.h"

#include "mseq/sequence/template_codec.h"

#include <charconv>
#include <initializer_list>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace mseq::sequence {

namespace {

// Placeholders used while rendering the template skeleton. They never occur in
// identifiers; templates or slugs containing them skip the structural rule.
constexpr char kSequenceMark = '\x01';
constexpr char kOpenSubcategoryMark = '\x02';

constexpr const char* kOpenSubcategoryClass = "([A-Z0-9-]*)";

std::optional<std::int64_t> parse_int64(const std::string_view digits) {
  if (digits.empty()) {
    return std::nullopt;
  }
  std::int64_t value = 0;
  const auto* first = digits.data();
  const auto* last = digits.data() + digits.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

bool is_regex_special(const char c) {
  switch (c) {
    case '\\':
    case '^':
    case '$':
    case '.':
    case '|':
    case '?':
    case '*':
    case '+':
    case '(':
    case ')':
    case '[':
    case ']':
    case '{':
    case '}':
      return true;
    default:
      return false;
  }
}

bool contains_marks(const std::string_view text) {
  return text.find(kSequenceMark) != std::string_view::npos ||
         text.find(kOpenSubcategoryMark) != std::string_view::npos;
}

// Renders the template the way encode() does, but with the sequence (and an
// unknown subcategory) left as marks, then applies the same hyphen cleanup.
std::optional<std::string> render_skeleton(const SequenceTemplate& tmpl,
                                           const DecodeContext& context,
                                           const bool open_subcategory) {
  const std::string category = to_upper_ascii(context.category_slug);
  const std::string subcategory = to_upper_ascii(context.subcategory_slug.value_or(""));
  if (contains_marks(category) || contains_marks(subcategory)) {
    return std::nullopt;
  }

  std::string rendered;
  for (const auto& segment : tmpl.segments()) {
    switch (segment.kind) {
      case SegmentKind::kLiteral:
        if (contains_marks(segment.text)) {
          return std::nullopt;
        }
        rendered += segment.text;
        break;
      case SegmentKind::kCategory:
        rendered += category;
        break;
      case SegmentKind::kSubcategory:
        if (open_subcategory) {
          rendered.push_back(kOpenSubcategoryMark);
        } else {
          rendered += subcategory;
        }
        break;
      case SegmentKind::kSequence:
        rendered.push_back(kSequenceMark);
        break;
    }
  }
  return collapse_hyphens(rendered);
}

// Turns a rendered skeleton into an anchored pattern. The first sequence mark
// becomes a capture group; later ones back-reference it.
std::optional<std::pair<std::string, std::size_t>> skeleton_pattern(const std::string& skeleton) {
  std::string pattern = "^";
  std::size_t group_count = 0;
  std::size_t sequence_group = 0;
  for (const char c : skeleton) {
    if (c == kSequenceMark) {
      if (sequence_group == 0) {
        sequence_group = ++group_count;
        pattern += "(\\d+)";
      } else {
        pattern += "\\" + std::to_string(sequence_group);
      }
    } else if (c == kOpenSubcategoryMark) {
      ++group_count;
      pattern += kOpenSubcategoryClass;
    } else {
      if (is_regex_special(c)) {
        pattern.push_back('\\');
      }
      pattern.push_back(c);
    }
  }
  pattern += "$";

  if (sequence_group == 0) {
    return std::nullopt;
  }
  return std::make_pair(std::move(pattern), sequence_group);
}

std::optional<std::int64_t> search_first_group(const std::string_view identifier,
                                               const std::regex& re) {
  try {
    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_search(identifier.begin(), identifier.end(), match, re)) {
      return std::nullopt;
    }
    return parse_int64(match[1].str());
  } catch (const std::regex_error& /*e*/) {
    return std::nullopt;
  }
}

const std::regex& padded_number_pattern() {
  static const std::regex re(R"(\b0+([1-9]\d{2,})\b)", std::regex::ECMAScript);
  return re;
}

const std::regex& zero_padded_number_pattern() {
  static const std::regex re(R"(\b0+(\d+)\b)", std::regex::ECMAScript);
  return re;
}

std::optional<std::int64_t> decode_bare_digits(const std::string_view identifier) {
  std::vector<std::string_view> runs;
  std::size_t i = 0;
  while (i < identifier.size()) {
    if (identifier[i] >= '0' && identifier[i] <= '9') {
      const std::size_t start = i;
      while (i < identifier.size() && identifier[i] >= '0' && identifier[i] <= '9') {
        ++i;
      }
      runs.push_back(identifier.substr(start, i - start));
    } else {
      ++i;
    }
  }
  if (runs.empty()) {
    return std::nullopt;
  }
  for (auto it = runs.rbegin(); it != runs.rend(); ++it) {
    if (it->size() >= 2) {
      return parse_int64(*it);
    }
  }
  return parse_int64(runs.back());
}

}  // namespace

const char* strategy_name(const DecodeStrategy strategy) {
  switch (strategy) {
    case DecodeStrategy::kStructural:
      return "structural";
    case DecodeStrategy::kPaddedNumber:
      return "padded_number";
    case DecodeStrategy::kZeroPaddedNumber:
      return "zero_padded_number";
    case DecodeStrategy::kBareDigits:
      return "bare_digits";
  }
  return "unknown";
}

SequenceDecoder::SequenceDecoder(const SequenceTemplate& old_template,
                                 const DecodeContext& context) {
  if (!old_template.has_token(SegmentKind::kSequence)) {
    return;
  }

  const auto compile = [&](const bool open_subcategory) -> std::optional<CompiledSkeleton> {
    const auto skeleton = render_skeleton(old_template, context, open_subcategory);
    if (!skeleton) {
      return std::nullopt;
    }
    auto pattern = skeleton_pattern(*skeleton);
    if (!pattern) {
      return std::nullopt;
    }
    try {
      return CompiledSkeleton{
          std::regex(pattern->first, std::regex::ECMAScript | std::regex::icase),
          pattern->second};
    } catch (const std::regex_error& /*e*/) {
      return std::nullopt;
    }
  };

  const bool has_subcategory_token = old_template.has_token(SegmentKind::kSubcategory);
  const bool subcategory_known = context.subcategory_slug.has_value();
  const bool subcategory_empty = !subcategory_known || context.subcategory_slug->empty();

  // Known slugs mirror encode() exactly, including the hyphen cleanup around an
  // empty subcategory.
  if (subcategory_known || !has_subcategory_token) {
    known_slugs_ = compile(false);
  }
  if (has_subcategory_token && subcategory_empty) {
    open_subcategory_ = compile(true);
  }
}

std::optional<std::int64_t> SequenceDecoder::decode_structural(
    const std::string_view identifier) const {
  for (const auto* compiled : {&known_slugs_, &open_subcategory_}) {
    if (!compiled->has_value()) {
      continue;
    }
    try {
      std::match_results<std::string_view::const_iterator> match;
      if (std::regex_match(identifier.begin(), identifier.end(), match, (*compiled)->pattern)) {
        return parse_int64(match[(*compiled)->sequence_group].str());
      }
    } catch (const std::regex_error& /*e*/) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

std::optional<std::int64_t> SequenceDecoder::decode_with(const DecodeStrategy strategy,
                                                         const std::string_view identifier) const {
  switch (strategy) {
    case DecodeStrategy::kStructural:
      return decode_structural(identifier);
    case DecodeStrategy::kPaddedNumber:
      return search_first_group(identifier, padded_number_pattern());
    case DecodeStrategy::kZeroPaddedNumber:
      return search_first_group(identifier, zero_padded_number_pattern());
    case DecodeStrategy::kBareDigits:
      return decode_bare_digits(identifier);
  }
  return std::nullopt;
}

std::optional<DecodeResult> SequenceDecoder::decode(const std::string_view identifier) const {
  for (const auto strategy : kDecodeOrder) {
    if (const auto number = decode_with(strategy, identifier)) {
      return DecodeResult{*number, strategy};
    }
  }
  return std::nullopt;
}

std::optional<std::int64_t> decode_with(const DecodeStrategy strategy,
                                        const std::string_view identifier,
                                        const SequenceTemplate& old_template,
                                        const DecodeContext& context) {
  return SequenceDecoder(old_template, context).decode_with(strategy, identifier);
}

std::optional<DecodeResult> decode(const std::string_view identifier,
                                   const SequenceTemplate& old_template,
                                   const DecodeContext& context) {
  return SequenceDecoder(old_template, context).decode(identifier);
}

std::optional<DecodeResult> decode(const std::string_view identifier,
                                   const std::string& old_format, const DecodeContext& context) {
  return decode(identifier, SequenceTemplate::parse_lenient(old_format), context);
}

}  // namespace mseq::sequence
