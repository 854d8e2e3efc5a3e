#include "cardforge/service/AdmissionController.hpp"
#include "cardforge/util/Logging.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <utility>

namespace cardforge::service {
namespace {
std::int64_t toMillis(quota::TimePoint timePoint) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(timePoint.time_since_epoch()).count();
}

AdmissionController::ClockFn orSystemClock(AdmissionController::ClockFn clock) {
    if (clock) {
        return clock;
    }
    return [] { return quota::Clock::now(); };
}
} // namespace

AdmissionController::AdmissionController(quota::QuotaSettings settings, ClockFn clock)
    : shared_(nullptr)
    , settings_(std::move(settings))
    , clock_(orSystemClock(std::move(clock))) {}

AdmissionController::AdmissionController(quota::QuotaStore& shared, quota::QuotaSettings settings, ClockFn clock)
    : shared_(&shared)
    , settings_(std::move(settings))
    , clock_(orSystemClock(std::move(clock))) {}

template <typename Fn>
auto AdmissionController::withStore(quota::TimePoint now, Fn&& fn) -> decltype(fn(std::declval<quota::QuotaStore&>())) {
    if (shared_ && toMillis(now) >= retrySharedAtMs_.load()) {
        try {
            return fn(*shared_);
        } catch (const std::exception& ex) {
            retrySharedAtMs_ = toMillis(now + settings_.fallbackCooldown);
            util::log(util::LogLevel::warn,
                      std::string{"Shared quota store unavailable, using in-process state: "} + ex.what());
        }
    }
    return fn(fallback_);
}

AdmissionDecision AdmissionController::checkAndRecord(const std::string& identity, const std::string& action) {
    const auto now = clock_();
    const auto& policy = settings_.policyFor(action);
    const auto key = windowKey(identity, action);

    auto outcome = withStore(now, [&](quota::QuotaStore& store) { return store.tryRecord(key, now, policy); });

    AdmissionDecision decision;
    decision.limit = policy.limit;
    decision.remaining = std::max(0, policy.limit - outcome.usage.inWindow);
    decision.resetAt = resetTime(outcome.usage, policy, now);
    if (outcome.admitted) {
        decision.admitted = true;
        return decision;
    }

    decision.violationCount = withStore(now, [&](quota::QuotaStore& store) {
        return store.addViolation(identity, now, settings_.violationTtl);
    });
    decision.retryAfterSeconds =
        static_cast<int>(settings_.baseDelay.count()) * penaltyMultiplier(decision.violationCount);
    if (outcome.burstExceeded) {
        decision.reason = "Burst limit exceeded: " + std::to_string(outcome.usage.inBurst) + "/" +
                          std::to_string(policy.burst) + " requests per " +
                          std::to_string(policy.burstWindow.count()) + "s";
    } else {
        decision.reason = "Rate limit exceeded: " + std::to_string(outcome.usage.inWindow) + "/" +
                          std::to_string(policy.limit) + " requests per " +
                          std::to_string(policy.window.count()) + "s";
    }

    util::log(util::LogLevel::warn,
              "Quota denied for " + identity + " on " + action + ": " + decision.reason +
                  " (violation " + std::to_string(decision.violationCount) + ", retry after " +
                  std::to_string(decision.retryAfterSeconds) + "s)");
    return decision;
}

AdmissionDecision AdmissionController::checkAndRecord(const Caller& caller, const std::string& action) {
    if (caller.identity.empty() && caller.sourceAddress.empty()) {
        return checkAndRecord(std::string{"anonymous"}, action);
    }

    std::optional<AdmissionDecision> identityDecision;
    if (!caller.identity.empty()) {
        identityDecision = checkAndRecord("user:" + caller.identity, action);
        if (!identityDecision->admitted || caller.sourceAddress.empty()) {
            return *identityDecision;
        }
    }

    auto addressDecision = checkAndRecord("ip:" + caller.sourceAddress, action);
    if (identityDecision && addressDecision.admitted) {
        addressDecision.remaining = std::min(addressDecision.remaining, identityDecision->remaining);
        addressDecision.resetAt = std::max(addressDecision.resetAt, identityDecision->resetAt);
    }
    return addressDecision;
}

AdmissionDecision AdmissionController::peek(const std::string& identity, const std::string& action) {
    const auto now = clock_();
    const auto& policy = settings_.policyFor(action);
    const auto key = windowKey(identity, action);

    auto usage = withStore(now, [&](quota::QuotaStore& store) { return store.usage(key, now, policy); });
    auto violations = withStore(now, [&](quota::QuotaStore& store) { return store.violations(identity, now); });

    AdmissionDecision decision;
    decision.limit = policy.limit;
    decision.remaining = std::max(0, policy.limit - usage.inWindow);
    decision.admitted = usage.inWindow < policy.limit && usage.inBurst < policy.burst;
    decision.violationCount = violations;
    decision.resetAt = resetTime(usage, policy, now);
    return decision;
}

int AdmissionController::penaltyMultiplier(int violationCount) const {
    const int cap = std::max(1, settings_.maxMultiplier);
    int multiplier = 1;
    for (int i = 1; i < violationCount && multiplier < cap; ++i) {
        multiplier *= 2;
    }
    return std::min(multiplier, cap);
}

void AdmissionController::purgeExpired() {
    const auto now = clock_();
    fallback_.purgeExpired(now);
    if (shared_ && toMillis(now) >= retrySharedAtMs_.load()) {
        try {
            shared_->purgeExpired(now);
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::warn, std::string{"Purging shared quota store failed: "} + ex.what());
        }
    }
}

bool AdmissionController::usingFallback() const {
    if (!shared_) {
        return true;
    }
    return toMillis(clock_()) < retrySharedAtMs_.load();
}

std::string AdmissionController::windowKey(const std::string& identity, const std::string& action) {
    return "rate_limit:" + action + ":" + identity;
}

quota::TimePoint AdmissionController::resetTime(const quota::WindowUsage& usage,
                                                const quota::QuotaPolicy& policy,
                                                quota::TimePoint now) {
    if (usage.oldest) {
        return *usage.oldest + policy.window;
    }
    return now + policy.window;
}

} // namespace cardforge::service
