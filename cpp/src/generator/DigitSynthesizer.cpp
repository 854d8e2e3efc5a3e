#include "cardforge/generator/DigitSynthesizer.hpp"
#include "cardforge/util/Logging.hpp"

#include <algorithm>
#include <array>
#include <random>
#include <stdexcept>

namespace cardforge::generator {
namespace {
// Low digits are twice as likely as high ones.
constexpr std::array<double, 10> kDigitWeights{2, 2, 2, 2, 2, 2, 1, 1, 1, 1};

bool isRun(int a, int b, int c) {
    if (a == b && b == c) {
        return true;
    }
    if (b == a + 1 && c == b + 1) {
        return true;
    }
    return b == a - 1 && c == b - 1;
}
} // namespace

DigitSynthesizer::DigitSynthesizer(int maxReshuffles)
    : maxReshuffles_(std::max(0, maxReshuffles)) {}

SynthesisResult DigitSynthesizer::synthesize(std::string_view prefix,
                                             std::size_t targetLength,
                                             util::RandomEngine& rng) const {
    if (targetLength <= prefix.size() + 1) {
        throw std::invalid_argument("target length leaves no room for generated digits");
    }
    const std::size_t count = targetLength - prefix.size() - 1;

    SynthesisResult result;
    result.digits = drawWeighted(count, rng);

    std::string number(prefix);
    number += result.digits;
    while (hasForbiddenRun(number, prefix.size())) {
        if (result.reshuffles >= maxReshuffles_) {
            result.digits = drawUniform(count, rng);
            result.usedFallback = true;
            util::log(util::LogLevel::debug,
                      "pattern filter gave up after " + std::to_string(result.reshuffles) +
                          " reshuffles for prefix " + std::string(prefix));
            return result;
        }
        std::shuffle(result.digits.begin(), result.digits.end(), rng);
        ++result.reshuffles;
        number.replace(prefix.size(), count, result.digits);
    }
    return result;
}

bool DigitSynthesizer::hasForbiddenRun(std::string_view number, std::size_t suffixStart) {
    if (number.size() < 3) {
        return false;
    }
    std::size_t first = suffixStart >= 2 ? suffixStart - 2 : 0;
    for (std::size_t i = first; i + 2 < number.size(); ++i) {
        if (isRun(number[i] - '0', number[i + 1] - '0', number[i + 2] - '0')) {
            return true;
        }
    }
    return false;
}

std::string DigitSynthesizer::drawWeighted(std::size_t count, util::RandomEngine& rng) const {
    std::array<int, 10> used{};
    std::discrete_distribution<int> full(kDigitWeights.begin(), kDigitWeights.end());
    std::uniform_int_distribution<int> uniform(0, 9);

    std::string digits;
    digits.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        int digit = full(rng);
        if (used[digit] >= kMaxOccurrences) {
            std::array<double, 10> remaining{};
            bool any = false;
            for (int d = 0; d < 10; ++d) {
                if (used[d] < kMaxOccurrences) {
                    remaining[d] = kDigitWeights[d];
                    any = true;
                }
            }
            if (any) {
                std::discrete_distribution<int> restricted(remaining.begin(), remaining.end());
                digit = restricted(rng);
            } else {
                digit = uniform(rng);
            }
        }
        ++used[digit];
        digits.push_back(static_cast<char>('0' + digit));
    }
    return digits;
}

std::string DigitSynthesizer::drawUniform(std::size_t count, util::RandomEngine& rng) const {
    std::uniform_int_distribution<int> uniform(0, 9);
    std::string digits;
    digits.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        digits.push_back(static_cast<char>('0' + uniform(rng)));
    }
    return digits;
}

} // namespace cardforge::generator
