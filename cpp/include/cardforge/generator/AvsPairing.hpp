#pragma once

#include "cardforge/util/Random.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cardforge::generator {

class AvsPairing {
public:
    bool supports(std::string_view countryCode) const;

    // nullopt for countries outside the reference table.
    std::optional<std::string> pairPostalCode(std::string_view countryCode,
                                              util::RandomEngine& rng) const;

    std::vector<std::string> supportedCountries() const;
    std::vector<std::string> postalCodesFor(std::string_view countryCode) const;
};

} // namespace cardforge::generator
