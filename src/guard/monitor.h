#pragma once

/// @file monitor.h
/// @brief Append-only audit log of detections with aggregate statistics
///
/// Prompts are never stored: each entry keeps a truncated SHA-256 of the
/// input plus the verdict summary.

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "detector/detection_engine.h"

namespace promptshield::guard {

/// @brief One audit record
struct DetectionLogEntry {
    std::chrono::system_clock::time_point timestamp;
    std::string prompt_hash;    ///< First 16 hex chars of SHA-256
    detector::ThreatLevel threat_level = detector::ThreatLevel::kSafe;
    double risk_score = 0.0;
    size_t patterns_detected = 0;

    /// @brief ISO 8601 UTC rendering of the timestamp
    std::string TimestampString() const;
};

/// @brief Aggregates over all entries
struct MonitorStats {
    size_t total_detections = 0;
    std::map<std::string, size_t> threat_distribution;  ///< Keyed by level wire name
    double avg_risk_score = 0.0;
};

/// @brief Thread-safe detection recorder
class Monitor {
public:
    Monitor() = default;

    // Disable copy
    Monitor(const Monitor&) = delete;
    Monitor& operator=(const Monitor&) = delete;

    /// @brief Append one entry for @p prompt and its verdict
    void Log(std::string_view prompt, const detector::DetectionResult& result);

    /// @brief Totals, per-level counts and mean risk score
    MonitorStats Stats() const;

    /// @brief Copy of all entries in append order
    std::vector<DetectionLogEntry> Entries() const;

    size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::vector<DetectionLogEntry> entries_;
};

/// @brief Lowercase hex SHA-256 of @p text truncated to 16 characters
std::string HashPrompt(std::string_view text);

}  // namespace promptshield::guard
