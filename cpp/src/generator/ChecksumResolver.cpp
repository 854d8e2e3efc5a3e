#include "cardforge/generator/ChecksumResolver.hpp"
#include "cardforge/util/Errors.hpp"
#include "cardforge/util/StringUtil.hpp"

#include <stdexcept>

namespace cardforge::generator {
namespace {
int luhnSum(std::string_view digits) {
    int sum = 0;
    bool doubleIt = false;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        int value = *it - '0';
        if (doubleIt) {
            value *= 2;
            if (value > 9) {
                value -= 9;
            }
        }
        sum += value;
        doubleIt = !doubleIt;
    }
    return sum;
}
} // namespace

bool ChecksumResolver::isValid(std::string_view number) {
    if (!util::isAllDigits(number) || number.size() < 2) {
        return false;
    }
    return luhnSum(number) % 10 == 0;
}

std::string ChecksumResolver::solve(std::string_view partialNumber) {
    if (!util::isAllDigits(partialNumber)) {
        throw std::invalid_argument("partial card number must contain digits only");
    }
    std::string candidate(partialNumber);
    candidate.push_back('0');
    for (char digit = '0'; digit <= '9'; ++digit) {
        candidate.back() = digit;
        if (isValid(candidate)) {
            return candidate;
        }
    }
    throw util::InvariantViolation("no check digit satisfies the checksum for " + std::string(partialNumber));
}

} // namespace cardforge::generator
