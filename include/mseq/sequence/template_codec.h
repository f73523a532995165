#pragma once

#include "mseq/sequence/sequence_template.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace mseq::sequence {

// Renders a sequence number in decimal, left-padded with '0' to kSequencePadWidth.
// Numbers wider than the pad width are rendered in full.
[[nodiscard]] std::string pad_sequence(std::int64_t number);

// Collapses every run of '-' into a single '-' and strips one leading and one
// trailing '-'. An absent subcategory leaves an empty segment between two
// separators; this pass removes the resulting double hyphen.
[[nodiscard]] std::string collapse_hyphens(std::string_view text);

// ASCII uppercase.
[[nodiscard]] std::string to_upper_ascii(std::string_view text);

// encode renders an identifier:
//   {category}    -> uppercased category slug
//   {subcategory} -> uppercased subcategory slug, or "" when there is none
//   {sequence}    -> pad_sequence(number)
// followed by collapse_hyphens(). Every occurrence of a token is substituted.
// Total for any parsed template; number is expected to be >= 0.
[[nodiscard]] std::string encode(const SequenceTemplate& tmpl, std::string_view category_slug,
                                 std::string_view subcategory_slug, std::int64_t number);

// Convenience overload for raw format strings (parsed leniently).
[[nodiscard]] std::string encode(const std::string& format, std::string_view category_slug,
                                 std::string_view subcategory_slug, std::int64_t number);

}  // namespace mseq::sequence
