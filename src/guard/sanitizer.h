#pragma once

/// @file sanitizer.h
/// @brief Rewrites flagged prompts into a neutralized form

#include <string>
#include <string_view>

#include "detector/detection_engine.h"

namespace promptshield::guard {

inline constexpr std::string_view kRedactionMarker = "[REDACTED]";

/// @brief Literal redaction of a verdict's flagged segments
///
/// Every flagged segment is replaced with kRedactionMarker, then role
/// fences (```system), special tokens (<|...|>) and bracketed
/// [SYSTEM]/[INST] markers are stripped and the result is trimmed. The
/// steps repeat until the text is stable, so sanitizing a sanitized text
/// is a no-op.
class Sanitizer {
public:
    Sanitizer() = default;

    /// @brief Neutralize @p text using the spans in @p result
    std::string Sanitize(std::string_view text, const detector::DetectionResult& result) const;

private:
    std::string SanitizeOnce(std::string_view text,
                             const detector::DetectionResult& result) const;
};

/// @brief Strip known delimiter tokens without redacting anything else
std::string StripDelimiters(std::string_view text);

}  // namespace promptshield::guard
