#include <gtest/gtest.h>

#include "cardforge/service/AdmissionController.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace cardforge;
using namespace std::chrono_literals;

namespace {

struct FakeClock {
    quota::TimePoint now{quota::Clock::from_time_t(1700000000)};

    service::AdmissionController::ClockFn fn() {
        return [this] { return now; };
    }
};

quota::QuotaSettings settingsWith(const std::string& action, quota::QuotaPolicy policy) {
    auto settings = quota::QuotaSettings::withDefaults();
    settings.policies[action] = policy;
    return settings;
}

class UnreachableQuotaStore : public quota::QuotaStore {
public:
    quota::RecordOutcome tryRecord(const std::string&, quota::TimePoint, const quota::QuotaPolicy&) override {
        return fail();
    }
    quota::WindowUsage usage(const std::string&, quota::TimePoint, const quota::QuotaPolicy&) override {
        fail();
        return {};
    }
    int addViolation(const std::string&, quota::TimePoint, std::chrono::seconds) override {
        fail();
        return 0;
    }
    int violations(const std::string&, quota::TimePoint) override {
        fail();
        return 0;
    }
    void purgeExpired(quota::TimePoint) override { fail(); }

    int calls{0};

private:
    quota::RecordOutcome fail() {
        ++calls;
        throw std::runtime_error("quota backend down");
    }
};

} // namespace

TEST(AdmissionController, SixthRapidCallIsDenied) {
    FakeClock clock;
    service::AdmissionController controller{settingsWith("generate", {5, 60s, 10, 60s}), clock.fn()};

    for (int i = 0; i < 5; ++i) {
        auto decision = controller.checkAndRecord("user-1", "generate");
        EXPECT_TRUE(decision.admitted);
        EXPECT_EQ(decision.remaining, 4 - i);
        EXPECT_EQ(decision.limit, 5);
    }
    auto denied = controller.checkAndRecord("user-1", "generate");
    EXPECT_FALSE(denied.admitted);
    EXPECT_GT(denied.retryAfterSeconds, 0);
    EXPECT_EQ(denied.violationCount, 1);
    EXPECT_EQ(denied.remaining, 0);
    EXPECT_FALSE(denied.reason.empty());
}

TEST(AdmissionController, WindowSlidesAndResumes) {
    FakeClock clock;
    service::AdmissionController controller{settingsWith("generate", {5, 60s, 10, 60s}), clock.fn()};
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(controller.checkAndRecord("user-1", "generate").admitted);
    }
    EXPECT_FALSE(controller.checkAndRecord("user-1", "generate").admitted);

    clock.now += 61s;
    EXPECT_TRUE(controller.checkAndRecord("user-1", "generate").admitted);
}

TEST(AdmissionController, IdentitiesAndActionsAreIndependent) {
    FakeClock clock;
    service::AdmissionController controller{settingsWith("generate", {1, 60s, 10, 60s}), clock.fn()};
    EXPECT_TRUE(controller.checkAndRecord("a", "generate").admitted);
    EXPECT_FALSE(controller.checkAndRecord("a", "generate").admitted);
    EXPECT_TRUE(controller.checkAndRecord("b", "generate").admitted);
    EXPECT_TRUE(controller.checkAndRecord("a", "bin_lookup").admitted);
}

TEST(AdmissionController, BurstDenialNamesBurstLimit) {
    FakeClock clock;
    service::AdmissionController controller{settingsWith("lookup", {100, 60s, 3, 10s}), clock.fn()};
    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(controller.checkAndRecord("u", "lookup").admitted);
    }
    auto denied = controller.checkAndRecord("u", "lookup");
    EXPECT_FALSE(denied.admitted);
    EXPECT_NE(denied.reason.find("Burst"), std::string::npos);

    clock.now += 11s;
    EXPECT_TRUE(controller.checkAndRecord("u", "lookup").admitted);
}

TEST(AdmissionController, PenaltyDoublesUpToCap) {
    FakeClock clock;
    service::AdmissionController controller{settingsWith("generate", {1, 3600s, 10, 60s}), clock.fn()};
    ASSERT_TRUE(controller.checkAndRecord("u", "generate").admitted);

    const int expected[] = {60, 120, 240, 480, 960, 960, 960};
    int previous = 0;
    for (int i = 0; i < 7; ++i) {
        auto decision = controller.checkAndRecord("u", "generate");
        ASSERT_FALSE(decision.admitted);
        EXPECT_EQ(decision.violationCount, i + 1);
        EXPECT_EQ(decision.retryAfterSeconds, expected[i]);
        EXPECT_GE(decision.retryAfterSeconds, previous);
        previous = decision.retryAfterSeconds;
    }
}

TEST(AdmissionController, PenaltyMultiplierSequence) {
    service::AdmissionController controller{quota::QuotaSettings::withDefaults()};
    EXPECT_EQ(controller.penaltyMultiplier(0), 1);
    EXPECT_EQ(controller.penaltyMultiplier(1), 1);
    EXPECT_EQ(controller.penaltyMultiplier(2), 2);
    EXPECT_EQ(controller.penaltyMultiplier(3), 4);
    EXPECT_EQ(controller.penaltyMultiplier(4), 8);
    EXPECT_EQ(controller.penaltyMultiplier(5), 16);
    EXPECT_EQ(controller.penaltyMultiplier(12), 16);
}

TEST(AdmissionController, ViolationCountResetsAfterTtl) {
    FakeClock clock;
    service::AdmissionController controller{settingsWith("generate", {1, 60s, 10, 60s}), clock.fn()};
    ASSERT_TRUE(controller.checkAndRecord("u", "generate").admitted);
    EXPECT_EQ(controller.checkAndRecord("u", "generate").retryAfterSeconds, 60);
    EXPECT_EQ(controller.checkAndRecord("u", "generate").retryAfterSeconds, 120);

    clock.now += 3601s;
    ASSERT_TRUE(controller.checkAndRecord("u", "generate").admitted);
    auto denied = controller.checkAndRecord("u", "generate");
    EXPECT_EQ(denied.violationCount, 1);
    EXPECT_EQ(denied.retryAfterSeconds, 60);
}

TEST(AdmissionController, UnknownActionUsesDefaultPolicy) {
    service::AdmissionController controller{quota::QuotaSettings::withDefaults()};
    auto decision = controller.checkAndRecord("u", "something_new");
    EXPECT_TRUE(decision.admitted);
    EXPECT_EQ(decision.limit, 60);
    EXPECT_EQ(decision.remaining, 59);
}

TEST(AdmissionController, PeekReportsWithoutRecording) {
    FakeClock clock;
    service::AdmissionController controller{settingsWith("generate", {5, 60s, 10, 60s}), clock.fn()};
    EXPECT_EQ(controller.peek("u", "generate").remaining, 5);
    EXPECT_EQ(controller.peek("u", "generate").remaining, 5);
    controller.checkAndRecord("u", "generate");
    controller.checkAndRecord("u", "generate");
    auto view = controller.peek("u", "generate");
    EXPECT_EQ(view.remaining, 3);
    EXPECT_TRUE(view.admitted);
    EXPECT_EQ(view.resetAt, clock.now + 60s);
}

TEST(AdmissionController, DualKeyDeniesOnSharedAddress) {
    FakeClock clock;
    service::AdmissionController controller{settingsWith("generate", {3, 60s, 10, 60s}), clock.fn()};
    for (int i = 0; i < 3; ++i) {
        auto decision = controller.checkAndRecord(service::Caller{"alice", "10.0.0.1"}, "generate");
        EXPECT_TRUE(decision.admitted);
        EXPECT_EQ(decision.remaining, 2 - i);
    }

    auto bob = controller.checkAndRecord(service::Caller{"bob", "10.0.0.1"}, "generate");
    EXPECT_FALSE(bob.admitted);
    // The identity marker recorded before the address denial stays.
    EXPECT_EQ(controller.peek("user:bob", "generate").remaining, 2);

    EXPECT_TRUE(controller.checkAndRecord(service::Caller{"bob", "10.0.0.2"}, "generate").admitted);
}

TEST(AdmissionController, AnonymousCallersShareOneKey) {
    FakeClock clock;
    service::AdmissionController controller{settingsWith("generate", {2, 60s, 10, 60s}), clock.fn()};
    EXPECT_TRUE(controller.checkAndRecord(service::Caller{}, "generate").admitted);
    EXPECT_TRUE(controller.checkAndRecord(service::Caller{}, "generate").admitted);
    EXPECT_FALSE(controller.checkAndRecord(service::Caller{}, "generate").admitted);
}

TEST(AdmissionController, FallsBackWhenSharedStoreFails) {
    FakeClock clock;
    UnreachableQuotaStore shared;
    service::AdmissionController controller{shared, settingsWith("generate", {5, 60s, 10, 60s}), clock.fn()};

    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(controller.checkAndRecord("u", "generate").admitted);
    }
    auto denied = controller.checkAndRecord("u", "generate");
    EXPECT_FALSE(denied.admitted);
    EXPECT_EQ(denied.retryAfterSeconds, 60);
    EXPECT_TRUE(controller.usingFallback());
    // The shared store is not retried during the cool-down.
    EXPECT_EQ(shared.calls, 1);

    clock.now += 31s;
    EXPECT_FALSE(controller.checkAndRecord("u", "generate").admitted);
    EXPECT_EQ(shared.calls, 2);
}

TEST(AdmissionController, SharedStoreIsPreferredWhenHealthy) {
    FakeClock clock;
    quota::MemoryQuotaStore shared;
    service::AdmissionController controller{shared, settingsWith("generate", {5, 60s, 10, 60s}), clock.fn()};
    controller.checkAndRecord("u", "generate");
    EXPECT_FALSE(controller.usingFallback());
    EXPECT_EQ(shared.trackedKeys(), 1u);
}

TEST(AdmissionController, ConcurrentCallersNeverOvershootOneKey) {
    service::AdmissionController controller{settingsWith("generate", {100, 60s, 100000, 60s})};
    std::atomic<int> admitted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                if (controller.checkAndRecord("shared-user", "generate").admitted) {
                    ++admitted;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(admitted.load(), 100);
}
