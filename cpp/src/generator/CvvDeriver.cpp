#include "cardforge/generator/CvvDeriver.hpp"

#include <openssl/evp.h>

#include <array>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace cardforge::generator {

std::size_t CvvDeriver::cvvLength(std::string_view number) {
    if (number.size() >= 2 && (number.substr(0, 2) == "34" || number.substr(0, 2) == "37")) {
        return 4;
    }
    return 3;
}

std::string CvvDeriver::derive(const std::string& number,
                               const model::Expiry& expiry,
                               bool seeded,
                               util::RandomEngine& rng) const {
    const auto length = cvvLength(number);
    if (seeded) {
        return seededCvv(number, expiry, length);
    }
    std::uniform_int_distribution<int> dist(0, 9);
    std::string cvv;
    cvv.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        cvv.push_back(static_cast<char>('0' + dist(rng)));
    }
    return cvv;
}

std::string CvvDeriver::seededCvv(const std::string& number,
                                  const model::Expiry& expiry,
                                  std::size_t length) {
    const std::string material = number + expiry.toString();

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLength = 0;
    if (EVP_Digest(material.data(), material.size(), digest.data(), &digestLength, EVP_sha256(), nullptr) != 1 ||
        digestLength < 8) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::uint64_t value = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        value = (value << 8) | digest[i];
    }

    std::uint64_t modulus = 1;
    for (std::size_t i = 0; i < length; ++i) {
        modulus *= 10;
    }

    std::ostringstream oss;
    oss << std::setw(static_cast<int>(length)) << std::setfill('0') << (value % modulus);
    return oss.str();
}

} // namespace cardforge::generator
