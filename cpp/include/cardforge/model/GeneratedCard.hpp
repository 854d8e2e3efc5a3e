#pragma once

#include "cardforge/model/BinRecord.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace cardforge::model {

struct Expiry {
    int month{};
    int year{};

    // "MM/YYYY", the form fed into the seeded CVV digest.
    std::string toString() const;

    bool operator==(const Expiry& other) const = default;
};

struct GeneratedCard {
    std::string number;
    std::string cvv;
    Expiry expiry;
    std::optional<std::string> postalCode;
    std::string bin;
    std::string brand;
    CardCategory category{CardCategory::Unknown};
    std::string issuer;
    std::string country;
    std::string countryName;
    std::chrono::system_clock::time_point generatedAt{};
};

// Amex-length numbers are grouped 4-6-5, everything else in blocks of four.
std::string formatCardNumber(const std::string& number);

} // namespace cardforge::model
