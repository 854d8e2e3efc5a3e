#include "cardforge/model/GeneratedCard.hpp"

#include <iomanip>
#include <sstream>

namespace cardforge::model {

std::string Expiry::toString() const {
    std::ostringstream oss;
    oss << std::setw(2) << std::setfill('0') << month << '/' << std::setw(4) << year;
    return oss.str();
}

std::string formatCardNumber(const std::string& number) {
    if (number.size() == 15) {
        return number.substr(0, 4) + ' ' + number.substr(4, 6) + ' ' + number.substr(10);
    }
    std::string formatted;
    formatted.reserve(number.size() + number.size() / 4);
    for (std::size_t i = 0; i < number.size(); ++i) {
        if (i > 0 && i % 4 == 0) {
            formatted.push_back(' ');
        }
        formatted.push_back(number[i]);
    }
    return formatted;
}

} // namespace cardforge::model
