#include <gtest/gtest.h>

#include "TestSupport.hpp"

#include "cardforge/generator/AvsPairing.hpp"
#include "cardforge/generator/CardLayout.hpp"
#include "cardforge/generator/CvvDeriver.hpp"
#include "cardforge/generator/ExpiryGenerator.hpp"
#include "cardforge/model/GeneratedCard.hpp"
#include "cardforge/util/StringUtil.hpp"

#include <algorithm>

using namespace cardforge;
using model::CardBrand;
using model::CardCategory;

TEST(CardLayout, LengthFollowsNetworkFamily) {
    EXPECT_EQ(generator::cardLengthFor(CardBrand::Amex, CardCategory::Credit, "378282"), 15u);
    EXPECT_EQ(generator::cardLengthFor(CardBrand::Visa, CardCategory::Credit, "424242"), 16u);
    EXPECT_EQ(generator::cardLengthFor(CardBrand::Visa, CardCategory::Prepaid, "453201"), 16u);
    EXPECT_EQ(generator::cardLengthFor(CardBrand::Mastercard, CardCategory::Debit, "510510"), 16u);
    EXPECT_EQ(generator::cardLengthFor(CardBrand::Discover, CardCategory::Credit, "601112"), 16u);
    EXPECT_EQ(generator::cardLengthFor(CardBrand::Diners, CardCategory::Credit, "361234"), 14u);
    EXPECT_EQ(generator::cardLengthFor(CardBrand::Diners, CardCategory::Credit, "550012"), 16u);
}

TEST(BinRecord, MapsFreeTextBrandNames) {
    EXPECT_EQ(model::brandFromName("AMERICAN EXPRESS"), CardBrand::Amex);
    EXPECT_EQ(model::brandFromName(" visa "), CardBrand::Visa);
    EXPECT_EQ(model::brandFromName("DINERS CLUB INTERNATIONAL"), CardBrand::Diners);
    EXPECT_EQ(model::brandFromName("MasterCard"), CardBrand::Mastercard);
    EXPECT_EQ(model::brandFromName("China UnionPay"), CardBrand::UnionPay);
    EXPECT_EQ(model::brandFromName("PRIVATE LABEL"), CardBrand::Other);
    EXPECT_EQ(model::categoryFromName("Debit"), CardCategory::Debit);
    EXPECT_EQ(model::categoryFromName("PREPAID DEBIT"), CardCategory::Prepaid);
    EXPECT_EQ(model::categoryFromName(""), CardCategory::Unknown);
}

TEST(GeneratedCard, FormatsNumbersForDisplay) {
    EXPECT_EQ(model::formatCardNumber("378282246310005"), "3782 822463 10005");
    EXPECT_EQ(model::formatCardNumber("4242424242424242"), "4242 4242 4242 4242");
    EXPECT_EQ(model::formatCardNumber("36123456789012"), "3612 3456 7890 12");
}

TEST(Expiry, RendersMonthAndYear) {
    EXPECT_EQ((model::Expiry{3, 2029}).toString(), "03/2029");
    EXPECT_EQ((model::Expiry{11, 2030}).toString(), "11/2030");
}

TEST(CvvDeriver, AmexFamilyGetsFourDigits) {
    EXPECT_EQ(generator::CvvDeriver::cvvLength("378282246310005"), 4u);
    EXPECT_EQ(generator::CvvDeriver::cvvLength("341111111111111"), 4u);
    EXPECT_EQ(generator::CvvDeriver::cvvLength("4242424242424242"), 3u);
    EXPECT_EQ(generator::CvvDeriver::cvvLength("3612345678901"), 3u);
}

TEST(CvvDeriver, SeededCvvIsDeterministic) {
    generator::CvvDeriver deriver;
    util::RandomEngine first{1};
    util::RandomEngine second{2};
    const model::Expiry expiry{6, 2030};

    auto a = deriver.derive("4242424242424242", expiry, true, first);
    auto b = deriver.derive("4242424242424242", expiry, true, second);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.size(), 3u);
    EXPECT_TRUE(util::isAllDigits(a));

    auto amex = deriver.derive("378282246310005", expiry, true, first);
    EXPECT_EQ(amex.size(), 4u);
    EXPECT_EQ(amex, deriver.derive("378282246310005", expiry, true, second));
}

TEST(CvvDeriver, SeededCvvDependsOnExpiry) {
    generator::CvvDeriver deriver;
    util::RandomEngine rng{5};
    int differing = 0;
    for (int month = 1; month <= 12; ++month) {
        auto base = deriver.derive("4242424242424242", model::Expiry{month, 2030}, true, rng);
        auto other = deriver.derive("4242424242424242", model::Expiry{month, 2031}, true, rng);
        differing += base != other ? 1 : 0;
    }
    EXPECT_GT(differing, 0);
}

TEST(CvvDeriver, RandomCvvHasNetworkLength) {
    generator::CvvDeriver deriver;
    util::RandomEngine rng{11};
    for (int i = 0; i < 100; ++i) {
        auto cvv = deriver.derive("4242424242424242", model::Expiry{1, 2030}, false, rng);
        ASSERT_EQ(cvv.size(), 3u);
        EXPECT_TRUE(util::isAllDigits(cvv));
        EXPECT_EQ(deriver.derive("378282246310005", model::Expiry{1, 2030}, false, rng).size(), 4u);
    }
}

TEST(ExpiryGenerator, StaysWithinCategoryHorizon) {
    generator::ExpiryGenerator generator;
    util::RandomEngine rng{17};
    const auto now = test_support::fixedNow();
    for (int i = 0; i < 500; ++i) {
        auto credit = generator.generate(CardCategory::Credit, now, rng);
        auto months = generator::ExpiryGenerator::monthsAhead(credit, now);
        EXPECT_GE(months, 36);
        EXPECT_LE(months, 60);
        EXPECT_GE(credit.month, 1);
        EXPECT_LE(credit.month, 12);

        auto prepaid = generator.generate(CardCategory::Prepaid, now, rng);
        months = generator::ExpiryGenerator::monthsAhead(prepaid, now);
        EXPECT_GE(months, 12);
        EXPECT_LE(months, 24);
    }
}

TEST(ExpiryGenerator, MonthArithmeticCrossesYears) {
    const auto now = test_support::fixedNow();
    EXPECT_EQ(generator::ExpiryGenerator::monthsAhead(model::Expiry{1, 2027}, now), 12);
    EXPECT_EQ(generator::ExpiryGenerator::monthsAhead(model::Expiry{12, 2026}, now), 11);
    EXPECT_EQ(generator::ExpiryGenerator::monthsAhead(model::Expiry{1, 2031}, now), 60);
}

TEST(AvsPairing, ServesReferenceCountries) {
    generator::AvsPairing avs;
    util::RandomEngine rng{23};

    EXPECT_TRUE(avs.supports("US"));
    EXPECT_TRUE(avs.supports(" gb "));
    EXPECT_FALSE(avs.supports("ZZ"));
    EXPECT_FALSE(avs.pairPostalCode("ZZ", rng).has_value());

    auto codes = avs.postalCodesFor("us");
    ASSERT_EQ(codes.size(), 5u);
    for (int i = 0; i < 50; ++i) {
        auto postal = avs.pairPostalCode("us", rng);
        ASSERT_TRUE(postal.has_value());
        EXPECT_NE(std::find(codes.begin(), codes.end(), *postal), codes.end());
    }

    auto countries = avs.supportedCountries();
    EXPECT_EQ(countries.size(), 7u);
    for (const char* code : {"US", "IT", "GB", "CA", "AU", "DE", "FR"}) {
        EXPECT_NE(std::find(countries.begin(), countries.end(), code), countries.end()) << code;
    }
}
