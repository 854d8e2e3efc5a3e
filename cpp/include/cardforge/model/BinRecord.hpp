#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace cardforge::model {

enum class CardBrand {
    Visa,
    Mastercard,
    Amex,
    Discover,
    Diners,
    Jcb,
    UnionPay,
    Maestro,
    Other
};

enum class CardCategory {
    Credit,
    Debit,
    Prepaid,
    Unknown
};

struct BinRecord {
    std::string prefix;
    std::string brand;
    CardCategory category{CardCategory::Unknown};
    std::string issuer;
    std::string country;
    std::string countryName;
    std::optional<std::string> level;
};

struct BlockedPrefix {
    std::string prefix;
    std::string reason;
};

// Maps the free-text network name carried by the metadata store
// ("AMERICAN EXPRESS", "Visa", "DINERS CLUB INTERNATIONAL", ...) to a family.
CardBrand brandFromName(std::string_view name);
CardCategory categoryFromName(std::string_view name);

std::string_view toString(CardBrand brand);
std::string_view toString(CardCategory category);

} // namespace cardforge::model
