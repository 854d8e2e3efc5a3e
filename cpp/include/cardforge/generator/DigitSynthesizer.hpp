#pragma once

#include "cardforge/util/Random.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace cardforge::generator {

struct SynthesisResult {
    std::string digits;
    int reshuffles{};
    bool usedFallback{false};
};

class DigitSynthesizer {
public:
    static constexpr int kDefaultMaxReshuffles = 100;
    static constexpr int kMaxOccurrences = 2;

    explicit DigitSynthesizer(int maxReshuffles = kDefaultMaxReshuffles);

    // Produces targetLength - prefix.size() - 1 digits; the last position of
    // the card number is left for the check digit.
    SynthesisResult synthesize(std::string_view prefix,
                               std::size_t targetLength,
                               util::RandomEngine& rng) const;

    // True when a 3-digit window touching the suffix (index >= suffixStart)
    // repeats one digit or steps up or down by one.
    static bool hasForbiddenRun(std::string_view number, std::size_t suffixStart);

private:
    std::string drawWeighted(std::size_t count, util::RandomEngine& rng) const;
    std::string drawUniform(std::size_t count, util::RandomEngine& rng) const;

    int maxReshuffles_;
};

} // namespace cardforge::generator
