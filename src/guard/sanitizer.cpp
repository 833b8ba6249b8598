/// @file sanitizer.cpp
/// @brief Sanitizer implementation

#include "guard/sanitizer.h"

#include <array>

#include <re2/re2.h>

#include <absl/strings/str_replace.h>
#include <absl/strings/strip.h>

namespace promptshield::guard {

namespace {

const std::array<const re2::RE2*, 3>& DelimiterPatterns() {
    static const std::array<const re2::RE2*, 3> patterns = {
        new re2::RE2(R"(```\s*(system|assistant|user))"),
        new re2::RE2(R"(<\|.*?\|>)"),
        new re2::RE2(R"(\[SYSTEM\]|\[INST\])"),
    };
    return patterns;
}

}  // namespace

std::string StripDelimiters(std::string_view text) {
    std::string stripped(text);
    // Every pattern matches at least one byte, so each round that removes
    // something shortens the text
    bool changed = true;
    while (changed) {
        changed = false;
        for (const re2::RE2* pattern : DelimiterPatterns()) {
            if (RE2::GlobalReplace(&stripped, *pattern, "") > 0) {
                changed = true;
            }
        }
    }
    return stripped;
}

std::string Sanitizer::Sanitize(std::string_view text,
                                const detector::DetectionResult& result) const {
    std::string current(text);
    // Delimiters are already stripped to a fixed point inside each pass, so
    // only redactions straddling a marker can need another pass
    const size_t max_passes = text.size() + 1;
    for (size_t pass = 0; pass < max_passes; ++pass) {
        std::string next = SanitizeOnce(current, result);
        if (next == current) {
            break;
        }
        current = std::move(next);
    }
    return current;
}

std::string Sanitizer::SanitizeOnce(std::string_view text,
                                    const detector::DetectionResult& result) const {
    std::string sanitized(text);

    for (const auto& span : result.flagged_segments) {
        // A segment inside the marker would be re-redacted forever
        if (span.segment.empty() ||
            kRedactionMarker.find(span.segment) != std::string_view::npos) {
            continue;
        }
        absl::StrReplaceAll(
            {{span.segment, absl::string_view(kRedactionMarker.data(), kRedactionMarker.size())}},
            &sanitized);
    }

    sanitized = StripDelimiters(sanitized);
    return std::string(absl::StripAsciiWhitespace(sanitized));
}

}  // namespace promptshield::guard
