#pragma once

#include <string>
#include <string_view>

namespace cardforge::generator {

class ChecksumResolver {
public:
    // Mod-10 check: double every second digit from the right, sum the
    // digits of the products, valid when the total is a multiple of ten.
    static bool isValid(std::string_view number);

    // Appends the first check digit in 0..9 that makes the number valid.
    // Throws std::invalid_argument on non-digit input and
    // util::InvariantViolation if no candidate passes.
    static std::string solve(std::string_view partialNumber);
};

} // namespace cardforge::generator
