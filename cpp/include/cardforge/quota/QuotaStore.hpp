#pragma once

#include "cardforge/quota/QuotaPolicy.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace cardforge::quota {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

struct WindowUsage {
    int inWindow{};
    int inBurst{};
    std::optional<TimePoint> oldest;
};

struct RecordOutcome {
    bool admitted{false};
    bool burstExceeded{false};
    // Counts include the new marker when admitted.
    WindowUsage usage;
};

// Keyed store for rolling request windows and violation counters.
// Each call is atomic for its key; distinct keys never share a lock.
class QuotaStore {
public:
    virtual ~QuotaStore() = default;

    // Drops markers at or before now - window, counts the rest and records
    // `now` only when both the window limit and the burst limit allow it.
    virtual RecordOutcome tryRecord(const std::string& key, TimePoint now, const QuotaPolicy& policy) = 0;

    virtual WindowUsage usage(const std::string& key, TimePoint now, const QuotaPolicy& policy) = 0;

    // Increments the counter and pushes its expiry to now + ttl. Returns the new count.
    virtual int addViolation(const std::string& identity, TimePoint now, std::chrono::seconds ttl) = 0;

    virtual int violations(const std::string& identity, TimePoint now) = 0;

    virtual void purgeExpired(TimePoint now) = 0;
};

} // namespace cardforge::quota
