#pragma once

#include "cardforge/quota/MemoryQuotaStore.hpp"
#include "cardforge/quota/QuotaPolicy.hpp"
#include "cardforge/quota/QuotaStore.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace cardforge::service {

struct AdmissionDecision {
    bool admitted{false};
    int remaining{};
    int retryAfterSeconds{};
    int violationCount{};
    int limit{};
    std::string reason;
    quota::TimePoint resetAt{};
};

// Who is asking: an authenticated identity and/or the network address the
// request came from. Either may be empty.
struct Caller {
    std::string identity;
    std::string sourceAddress;
};

class AdmissionController {
public:
    using ClockFn = std::function<quota::TimePoint()>;

    // In-process quota state only.
    explicit AdmissionController(quota::QuotaSettings settings, ClockFn clock = {});

    // Shared store first, in-process state while the shared store is failing.
    AdmissionController(quota::QuotaStore& shared, quota::QuotaSettings settings, ClockFn clock = {});

    AdmissionDecision checkAndRecord(const std::string& identity, const std::string& action);

    // Checks the identity key and then the source-address key. A denial on
    // the address key leaves the identity marker in place.
    AdmissionDecision checkAndRecord(const Caller& caller, const std::string& action);

    // Current usage without recording anything.
    AdmissionDecision peek(const std::string& identity, const std::string& action);

    int penaltyMultiplier(int violationCount) const;
    void purgeExpired();
    bool usingFallback() const;

    const quota::QuotaSettings& settings() const noexcept { return settings_; }

private:
    template <typename Fn>
    auto withStore(quota::TimePoint now, Fn&& fn) -> decltype(fn(std::declval<quota::QuotaStore&>()));

    static std::string windowKey(const std::string& identity, const std::string& action);
    static quota::TimePoint resetTime(const quota::WindowUsage& usage,
                                      const quota::QuotaPolicy& policy,
                                      quota::TimePoint now);

    quota::QuotaStore* shared_;
    quota::MemoryQuotaStore fallback_;
    quota::QuotaSettings settings_;
    ClockFn clock_;
    std::atomic<std::int64_t> retrySharedAtMs_{0};
};

} // namespace cardforge::service
