/*
 * toolgate C++17 - Text Matcher Implementation
 */
#include <toolgate/core/text_matcher.hpp>

namespace toolgate {
namespace text_matcher {

std::vector<Span> locate(const std::string& content, const std::string& needle) {
    std::vector<Span> spans;
    if (needle.empty()) {
        return spans;
    }

    size_t pos = content.find(needle);
    while (pos != std::string::npos) {
        spans.push_back(Span(pos, needle.size()));
        pos = content.find(needle, pos + needle.size());
    }
    return spans;
}

std::string apply(const std::string& content, const std::vector<Span>& spans,
                  const std::string& replacement) {
    std::string out;
    out.reserve(content.size() + spans.size() * replacement.size());

    size_t cursor = 0;
    for (size_t i = 0; i < spans.size(); ++i) {
        const Span& span = spans[i];
        if (span.offset < cursor || span.offset + span.length > content.size()) {
            continue;   // overlapping or out of range
        }
        out.append(content, cursor, span.offset - cursor);
        out.append(replacement);
        cursor = span.offset + span.length;
    }
    out.append(content, cursor, std::string::npos);
    return out;
}

Result<Replacement> replace(const std::string& content, const std::string& old_text,
                            const std::string& new_text, bool replace_all) {
    if (old_text.empty()) {
        return Result<Replacement>::failure(ErrorKind::InvalidArgument,
            "old_string must not be empty");
    }

    std::vector<Span> spans = locate(content, old_text);
    if (spans.empty()) {
        return Result<Replacement>::failure(ErrorKind::MatchNotFound,
            "old_string not found in file. Read the file again and copy the text exactly, "
            "including whitespace and indentation.");
    }

    if (spans.size() > 1 && !replace_all) {
        return Result<Replacement>::failure(ErrorKind::AmbiguousMatch,
            "old_string matches " + std::to_string(spans.size()) + " locations. "
            "Add surrounding lines to make it unique, or set replace_all to change every occurrence.",
            spans.size());
    }

    Replacement r;
    r.content = apply(content, spans, new_text);
    r.replacements = spans.size();
    return Result<Replacement>::success(r);
}

} // namespace text_matcher
} // namespace toolgate
