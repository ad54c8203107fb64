/*
 * toolgate C++17 - Text Matcher
 *
 * Literal (byte-for-byte) location and replacement of a text block inside
 * file content. No regex, no whitespace folding.
 */
#ifndef toolgate_CORE_TEXT_MATCHER_HPP
#define toolgate_CORE_TEXT_MATCHER_HPP

#include "result.hpp"
#include <string>
#include <vector>

namespace toolgate {

struct Span {
    size_t offset;
    size_t length;

    Span() : offset(0), length(0) {}
    Span(size_t o, size_t l) : offset(o), length(l) {}
};

struct Replacement {
    std::string content;
    size_t replacements;

    Replacement() : replacements(0) {}
};

namespace text_matcher {

// Non-overlapping occurrences of `needle`, scanned left to right.
// An empty needle matches nothing.
std::vector<Span> locate(const std::string& content, const std::string& needle);

// Replace `spans` (offsets into the original `content`, ascending and
// non-overlapping) with `replacement`. Bytes outside the spans are copied as is.
std::string apply(const std::string& content, const std::vector<Span>& spans,
                  const std::string& replacement);

// locate + apply with the uniqueness contract: MatchNotFound for zero
// matches, AmbiguousMatch(k) for k > 1 unless `replace_all`.
Result<Replacement> replace(const std::string& content, const std::string& old_text,
                            const std::string& new_text, bool replace_all);

} // namespace text_matcher

} // namespace toolgate

#endif // toolgate_CORE_TEXT_MATCHER_HPP
