#include "cardforge/generator/CardLayout.hpp"

namespace cardforge::generator {

std::size_t cardLengthFor(model::CardBrand brand,
                          model::CardCategory /*category*/,
                          std::string_view prefix) {
    switch (brand) {
    case model::CardBrand::Amex:
        return 15;
    case model::CardBrand::Diners:
        // 54/55 prefixes are the North American Mastercard co-brand.
        if (!prefix.empty() && prefix.front() == '5') {
            return 16;
        }
        return 14;
    case model::CardBrand::Discover:
    case model::CardBrand::Visa:
    case model::CardBrand::Mastercard:
    case model::CardBrand::Jcb:
    case model::CardBrand::UnionPay:
    case model::CardBrand::Maestro:
    case model::CardBrand::Other:
        break;
    }
    // Debit and prepaid ranges follow the network default.
    return 16;
}

} // namespace cardforge::generator
