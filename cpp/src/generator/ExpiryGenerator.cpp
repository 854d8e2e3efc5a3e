#include "cardforge/generator/ExpiryGenerator.hpp"

#include <ctime>
#include <random>

namespace cardforge::generator {
namespace {
std::tm toUtc(std::chrono::system_clock::time_point timePoint) {
    const std::time_t time = std::chrono::system_clock::to_time_t(timePoint);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    return tm;
}

int monthIndex(int year, int month) {
    return year * 12 + (month - 1);
}
} // namespace

ExpiryHorizon ExpiryGenerator::horizonFor(model::CardCategory category) {
    if (category == model::CardCategory::Prepaid) {
        return {12, 24};
    }
    return {36, 60};
}

model::Expiry ExpiryGenerator::generate(model::CardCategory category,
                                        std::chrono::system_clock::time_point now,
                                        util::RandomEngine& rng) const {
    const auto horizon = horizonFor(category);
    std::uniform_int_distribution<int> dist(horizon.minMonths, horizon.maxMonths);

    const std::tm tm = toUtc(now);
    const int target = monthIndex(tm.tm_year + 1900, tm.tm_mon + 1) + dist(rng);

    model::Expiry expiry;
    expiry.year = target / 12;
    expiry.month = target % 12 + 1;
    return expiry;
}

int ExpiryGenerator::monthsAhead(const model::Expiry& expiry, std::chrono::system_clock::time_point now) {
    const std::tm tm = toUtc(now);
    return monthIndex(expiry.year, expiry.month) - monthIndex(tm.tm_year + 1900, tm.tm_mon + 1);
}

} // namespace cardforge::generator
