#pragma once

#include "cardforge/model/GeneratedCard.hpp"
#include "cardforge/util/Random.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace cardforge::generator {

class CvvDeriver {
public:
    // Four digits for 34/37 (Amex family) numbers, three otherwise.
    static std::size_t cvvLength(std::string_view number);

    // Seeded codes are SHA-256(number + "MM/YYYY") reduced modulo 10^length,
    // so the same card always yields the same CVV.
    std::string derive(const std::string& number,
                       const model::Expiry& expiry,
                       bool seeded,
                       util::RandomEngine& rng) const;

private:
    static std::string seededCvv(const std::string& number,
                                 const model::Expiry& expiry,
                                 std::size_t length);
};

} // namespace cardforge::generator
