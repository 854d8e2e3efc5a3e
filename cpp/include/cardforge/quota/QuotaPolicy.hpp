#pragma once

#include <chrono>
#include <string>
#include <unordered_map>

namespace cardforge::quota {

struct QuotaPolicy {
    int limit{60};
    std::chrono::seconds window{60};
    int burst{10};
    std::chrono::seconds burstWindow{60};
};

struct QuotaSettings {
    static inline const std::string kDefaultAction = "default";

    std::unordered_map<std::string, QuotaPolicy> policies;
    std::chrono::seconds baseDelay{60};
    int maxMultiplier{16};
    std::chrono::seconds violationTtl{std::chrono::hours(1)};
    std::chrono::seconds fallbackCooldown{30};

    // Policy table used when the configuration file does not override it.
    static QuotaSettings withDefaults();

    const QuotaPolicy& policyFor(const std::string& action) const;
};

} // namespace cardforge::quota
