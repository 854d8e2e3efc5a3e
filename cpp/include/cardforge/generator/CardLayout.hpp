#pragma once

#include "cardforge/model/BinRecord.hpp"

#include <cstddef>
#include <string_view>

namespace cardforge::generator {

inline constexpr std::size_t kPrefixLength = 6;

// Total number length for a BIN. Depends only on the network family,
// the category and, for Diners, whether the prefix is a Mastercard co-brand.
std::size_t cardLengthFor(model::CardBrand brand,
                          model::CardCategory category,
                          std::string_view prefix);

} // namespace cardforge::generator
