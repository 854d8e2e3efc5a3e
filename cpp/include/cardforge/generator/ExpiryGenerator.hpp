#pragma once

#include "cardforge/model/BinRecord.hpp"
#include "cardforge/model/GeneratedCard.hpp"
#include "cardforge/util/Random.hpp"

#include <chrono>

namespace cardforge::generator {

struct ExpiryHorizon {
    int minMonths{};
    int maxMonths{};
};

class ExpiryGenerator {
public:
    // Prepaid: 12..24 months, everything else 36..60 months.
    static ExpiryHorizon horizonFor(model::CardCategory category);

    model::Expiry generate(model::CardCategory category,
                           std::chrono::system_clock::time_point now,
                           util::RandomEngine& rng) const;

    // Whole calendar months from the month of `now` to the expiry month.
    static int monthsAhead(const model::Expiry& expiry, std::chrono::system_clock::time_point now);
};

} // namespace cardforge::generator
