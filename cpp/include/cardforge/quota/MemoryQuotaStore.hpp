#pragma once

#include "cardforge/quota/QuotaStore.hpp"

#include <array>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace cardforge::quota {

// In-process store. Keys are spread over fixed segments, each guarded by
// its own mutex.
class MemoryQuotaStore : public QuotaStore {
public:
    static constexpr std::size_t kSegmentCount = 16;

    RecordOutcome tryRecord(const std::string& key, TimePoint now, const QuotaPolicy& policy) override;
    WindowUsage usage(const std::string& key, TimePoint now, const QuotaPolicy& policy) override;
    int addViolation(const std::string& identity, TimePoint now, std::chrono::seconds ttl) override;
    int violations(const std::string& identity, TimePoint now) override;
    void purgeExpired(TimePoint now) override;

    std::size_t trackedKeys() const;

private:
    struct WindowEntry {
        std::deque<TimePoint> markers;
        std::chrono::seconds window{};
    };

    struct ViolationEntry {
        int count{};
        TimePoint expiresAt{};
    };

    struct Segment {
        mutable std::mutex mutex;
        std::unordered_map<std::string, WindowEntry> windows;
        std::unordered_map<std::string, ViolationEntry> violations;
    };

    Segment& segmentFor(const std::string& key);
    static WindowUsage countLocked(WindowEntry& entry, TimePoint now, const QuotaPolicy& policy);

    std::array<Segment, kSegmentCount> segments_;
};

} // namespace cardforge::quota
