/// @file monitor.cpp
/// @brief Detection audit log implementation

#include "guard/monitor.h"

#include <iomanip>
#include <sstream>

#include <absl/time/time.h>
#include <openssl/sha.h>

#include "common/logging.h"

namespace promptshield::guard {

namespace {

constexpr size_t kPromptHashLength = 16;

}  // namespace

std::string HashPrompt(std::string_view text) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(text.data()), text.size(), digest);
    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (unsigned char c : digest) {
        out << std::setw(2) << static_cast<int>(c);
    }
    return out.str().substr(0, kPromptHashLength);
}

std::string DetectionLogEntry::TimestampString() const {
    return absl::FormatTime("%Y-%m-%dT%H:%M:%E6SZ", absl::FromChrono(timestamp),
                            absl::UTCTimeZone());
}

void Monitor::Log(std::string_view prompt, const detector::DetectionResult& result) {
    DetectionLogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.prompt_hash = HashPrompt(prompt);
    entry.threat_level = result.threat_level;
    entry.risk_score = result.risk_score;
    entry.patterns_detected = result.fired_patterns.size();

    if (detector::IsActionable(entry.threat_level)) {
        PROMPTSHIELD_LOG_WARN("Prompt injection detected: hash={} level={} score={:.1f} patterns={}",
                              entry.prompt_hash,
                              detector::ThreatLevelToString(entry.threat_level),
                              entry.risk_score, entry.patterns_detected);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(std::move(entry));
}

MonitorStats Monitor::Stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    MonitorStats stats;
    stats.total_detections = entries_.size();
    if (entries_.empty()) {
        return stats;
    }

    double score_sum = 0.0;
    for (const auto& entry : entries_) {
        ++stats.threat_distribution[detector::ThreatLevelToString(entry.threat_level)];
        score_sum += entry.risk_score;
    }
    stats.avg_risk_score = score_sum / static_cast<double>(entries_.size());
    return stats;
}

std::vector<DetectionLogEntry> Monitor::Entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

size_t Monitor::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace promptshield::guard
