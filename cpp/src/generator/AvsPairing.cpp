#include "cardforge/generator/AvsPairing.hpp"
#include "cardforge/util/StringUtil.hpp"

#include <map>
#include <random>

namespace cardforge::generator {
namespace {
const std::map<std::string, std::vector<std::string>>& postalTable() {
    static const std::map<std::string, std::vector<std::string>> table{
        {"US", {"10001", "90210", "60601", "94102", "33101"}},
        {"IT", {"00100", "20100", "80100", "40100", "50100"}},
        {"GB", {"SW1A 1AA", "M1 1AA", "B1 1AA", "L1 1AA", "CF1 1AA"}},
        {"CA", {"M5H 2N2", "V6B 1A1", "T2P 1J9", "H2Y 1A6", "K1A 0A6"}},
        {"AU", {"2000", "3000", "4000", "5000", "6000"}},
        {"DE", {"10115", "20095", "80331", "50667", "01067"}},
        {"FR", {"75001", "69001", "13001", "31000", "59000"}},
    };
    return table;
}

std::string normalizeCountry(std::string_view countryCode) {
    return util::toUpper(util::trim(countryCode));
}
} // namespace

bool AvsPairing::supports(std::string_view countryCode) const {
    return postalTable().count(normalizeCountry(countryCode)) > 0;
}

std::optional<std::string> AvsPairing::pairPostalCode(std::string_view countryCode,
                                                      util::RandomEngine& rng) const {
    auto it = postalTable().find(normalizeCountry(countryCode));
    if (it == postalTable().end() || it->second.empty()) {
        return std::nullopt;
    }
    std::uniform_int_distribution<std::size_t> dist(0, it->second.size() - 1);
    return it->second[dist(rng)];
}

std::vector<std::string> AvsPairing::supportedCountries() const {
    std::vector<std::string> countries;
    countries.reserve(postalTable().size());
    for (const auto& [code, codes] : postalTable()) {
        countries.push_back(code);
    }
    return countries;
}

std::vector<std::string> AvsPairing::postalCodesFor(std::string_view countryCode) const {
    auto it = postalTable().find(normalizeCountry(countryCode));
    if (it == postalTable().end()) {
        return {};
    }
    return it->second;
}

} // namespace cardforge::generator
