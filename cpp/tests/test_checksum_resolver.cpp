#include <gtest/gtest.h>

#include "cardforge/generator/ChecksumResolver.hpp"

#include <random>
#include <stdexcept>
#include <string>

using cardforge::generator::ChecksumResolver;

TEST(ChecksumResolver, AcceptsKnownValidNumbers) {
    EXPECT_TRUE(ChecksumResolver::isValid("4242424242424242"));
    EXPECT_TRUE(ChecksumResolver::isValid("4111111111111111"));
    EXPECT_TRUE(ChecksumResolver::isValid("378282246310005"));
    EXPECT_TRUE(ChecksumResolver::isValid("5555555555554444"));
}

TEST(ChecksumResolver, RejectsBrokenNumbers) {
    EXPECT_FALSE(ChecksumResolver::isValid("4242424242424241"));
    EXPECT_FALSE(ChecksumResolver::isValid("378282246310006"));
    EXPECT_FALSE(ChecksumResolver::isValid("4242-4242"));
    EXPECT_FALSE(ChecksumResolver::isValid(""));
    EXPECT_FALSE(ChecksumResolver::isValid("0"));
}

TEST(ChecksumResolver, SolvesCheckDigit) {
    EXPECT_EQ(ChecksumResolver::solve("424242424242424"), "4242424242424242");
    EXPECT_EQ(ChecksumResolver::solve("37828224631000"), "378282246310005");
    EXPECT_EQ(ChecksumResolver::solve("411111111111111"), "4111111111111111");
}

TEST(ChecksumResolver, RejectsNonDigitInput) {
    EXPECT_THROW(ChecksumResolver::solve("42424a"), std::invalid_argument);
    EXPECT_THROW(ChecksumResolver::solve(""), std::invalid_argument);
}

TEST(ChecksumResolver, EverySolvedNumberValidatesAndOnlyOneDigitFits) {
    std::mt19937_64 rng{2024};
    std::uniform_int_distribution<int> digit(0, 9);
    for (int n = 0; n < 500; ++n) {
        std::string partial;
        for (int i = 0; i < 15; ++i) {
            partial.push_back(static_cast<char>('0' + digit(rng)));
        }
        auto full = ChecksumResolver::solve(partial);
        ASSERT_EQ(full.size(), partial.size() + 1);
        EXPECT_EQ(full.substr(0, partial.size()), partial);
        EXPECT_TRUE(ChecksumResolver::isValid(full));

        int fits = 0;
        for (char c = '0'; c <= '9'; ++c) {
            fits += ChecksumResolver::isValid(partial + c) ? 1 : 0;
        }
        EXPECT_EQ(fits, 1);
    }
}
