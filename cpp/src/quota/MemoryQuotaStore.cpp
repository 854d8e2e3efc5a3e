#include "cardforge/quota/MemoryQuotaStore.hpp"

#include <functional>

namespace cardforge::quota {

MemoryQuotaStore::Segment& MemoryQuotaStore::segmentFor(const std::string& key) {
    return segments_[std::hash<std::string>{}(key) % kSegmentCount];
}

WindowUsage MemoryQuotaStore::countLocked(WindowEntry& entry, TimePoint now, const QuotaPolicy& policy) {
    entry.window = policy.window;
    const auto windowStart = now - policy.window;
    while (!entry.markers.empty() && entry.markers.front() <= windowStart) {
        entry.markers.pop_front();
    }

    WindowUsage usage;
    usage.inWindow = static_cast<int>(entry.markers.size());
    const auto burstStart = now - policy.burstWindow;
    for (auto it = entry.markers.rbegin(); it != entry.markers.rend() && *it > burstStart; ++it) {
        ++usage.inBurst;
    }
    if (!entry.markers.empty()) {
        usage.oldest = entry.markers.front();
    }
    return usage;
}

RecordOutcome MemoryQuotaStore::tryRecord(const std::string& key, TimePoint now, const QuotaPolicy& policy) {
    auto& segment = segmentFor(key);
    std::lock_guard<std::mutex> lock(segment.mutex);
    auto& entry = segment.windows[key];

    RecordOutcome outcome;
    outcome.usage = countLocked(entry, now, policy);
    if (outcome.usage.inWindow >= policy.limit) {
        return outcome;
    }
    if (outcome.usage.inBurst >= policy.burst) {
        outcome.burstExceeded = true;
        return outcome;
    }

    entry.markers.push_back(now);
    outcome.admitted = true;
    ++outcome.usage.inWindow;
    ++outcome.usage.inBurst;
    if (!outcome.usage.oldest) {
        outcome.usage.oldest = now;
    }
    return outcome;
}

WindowUsage MemoryQuotaStore::usage(const std::string& key, TimePoint now, const QuotaPolicy& policy) {
    auto& segment = segmentFor(key);
    std::lock_guard<std::mutex> lock(segment.mutex);
    auto it = segment.windows.find(key);
    if (it == segment.windows.end()) {
        return {};
    }
    return countLocked(it->second, now, policy);
}

int MemoryQuotaStore::addViolation(const std::string& identity, TimePoint now, std::chrono::seconds ttl) {
    auto& segment = segmentFor(identity);
    std::lock_guard<std::mutex> lock(segment.mutex);
    auto& entry = segment.violations[identity];
    if (entry.count > 0 && entry.expiresAt <= now) {
        entry.count = 0;
    }
    ++entry.count;
    entry.expiresAt = now + ttl;
    return entry.count;
}

int MemoryQuotaStore::violations(const std::string& identity, TimePoint now) {
    auto& segment = segmentFor(identity);
    std::lock_guard<std::mutex> lock(segment.mutex);
    auto it = segment.violations.find(identity);
    if (it == segment.violations.end()) {
        return 0;
    }
    if (it->second.expiresAt <= now) {
        segment.violations.erase(it);
        return 0;
    }
    return it->second.count;
}

void MemoryQuotaStore::purgeExpired(TimePoint now) {
    for (auto& segment : segments_) {
        std::lock_guard<std::mutex> lock(segment.mutex);
        for (auto it = segment.windows.begin(); it != segment.windows.end();) {
            auto& markers = it->second.markers;
            const auto windowStart = now - it->second.window;
            while (!markers.empty() && markers.front() <= windowStart) {
                markers.pop_front();
            }
            if (markers.empty()) {
                it = segment.windows.erase(it);
            } else {
                ++it;
            }
        }
        for (auto it = segment.violations.begin(); it != segment.violations.end();) {
            if (it->second.expiresAt <= now) {
                it = segment.violations.erase(it);
            } else {
                ++it;
            }
        }
    }
}

std::size_t MemoryQuotaStore::trackedKeys() const {
    std::size_t total = 0;
    for (const auto& segment : segments_) {
        std::lock_guard<std::mutex> lock(segment.mutex);
        total += segment.windows.size();
    }
    return total;
}

} // namespace cardforge::quota
