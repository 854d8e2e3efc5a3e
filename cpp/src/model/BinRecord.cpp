#include "cardforge/model/BinRecord.hpp"
#include "cardforge/util/StringUtil.hpp"

#include <string>

namespace cardforge::model {
namespace {
bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}
} // namespace

CardBrand brandFromName(std::string_view name) {
    const std::string upper = util::toUpper(util::trim(name));
    if (contains(upper, "AMERICAN EXPRESS") || contains(upper, "AMEX")) {
        return CardBrand::Amex;
    }
    if (contains(upper, "DINERS")) {
        return CardBrand::Diners;
    }
    if (contains(upper, "DISCOVER")) {
        return CardBrand::Discover;
    }
    if (contains(upper, "MASTERCARD") || contains(upper, "MASTER CARD")) {
        return CardBrand::Mastercard;
    }
    if (contains(upper, "MAESTRO")) {
        return CardBrand::Maestro;
    }
    if (contains(upper, "VISA")) {
        return CardBrand::Visa;
    }
    if (contains(upper, "JCB")) {
        return CardBrand::Jcb;
    }
    if (contains(upper, "UNIONPAY") || contains(upper, "UNION PAY")) {
        return CardBrand::UnionPay;
    }
    return CardBrand::Other;
}

CardCategory categoryFromName(std::string_view name) {
    const std::string upper = util::toUpper(util::trim(name));
    if (contains(upper, "PREPAID")) {
        return CardCategory::Prepaid;
    }
    if (contains(upper, "DEBIT")) {
        return CardCategory::Debit;
    }
    if (contains(upper, "CREDIT")) {
        return CardCategory::Credit;
    }
    return CardCategory::Unknown;
}

std::string_view toString(CardBrand brand) {
    switch (brand) {
    case CardBrand::Visa: return "VISA";
    case CardBrand::Mastercard: return "MASTERCARD";
    case CardBrand::Amex: return "AMERICAN EXPRESS";
    case CardBrand::Discover: return "DISCOVER";
    case CardBrand::Diners: return "DINERS CLUB";
    case CardBrand::Jcb: return "JCB";
    case CardBrand::UnionPay: return "UNIONPAY";
    case CardBrand::Maestro: return "MAESTRO";
    case CardBrand::Other: return "OTHER";
    }
    return "OTHER";
}

std::string_view toString(CardCategory category) {
    switch (category) {
    case CardCategory::Credit: return "credit";
    case CardCategory::Debit: return "debit";
    case CardCategory::Prepaid: return "prepaid";
    case CardCategory::Unknown: return "unknown";
    }
    return "unknown";
}

} // namespace cardforge::model
