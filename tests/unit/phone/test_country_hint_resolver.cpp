#include <gtest/gtest.h>
#include "phone/country_hint_resolver.h"

using namespace phonenorm::phone;

class CountryHintResolverTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(CountryHintResolverTest, ResolvesIsoCode) {
    auto result = CountryHintResolver::resolve("VN");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->calling_code, "84");
    EXPECT_EQ(result->iso_country, "VN");
}

TEST_F(CountryHintResolverTest, IsoCodeIsTrimmedAndCaseInsensitive) {
    auto result = CountryHintResolver::resolve("  sg\t");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->calling_code, "65");
    EXPECT_EQ(result->iso_country, "SG");
}

TEST_F(CountryHintResolverTest, IsoHintDisambiguatesSharedCode) {
    auto ca = CountryHintResolver::resolve("CA");
    ASSERT_TRUE(ca.has_value());
    EXPECT_EQ(ca->calling_code, "1");
    EXPECT_EQ(ca->iso_country, "CA");

    auto us = CountryHintResolver::resolve("us");
    ASSERT_TRUE(us.has_value());
    EXPECT_EQ(us->calling_code, "1");
    EXPECT_EQ(us->iso_country, "US");
}

TEST_F(CountryHintResolverTest, ResolvesAllSupportedIsoCodes) {
    for (const char* iso : {"VN", "US", "CA", "SG", "TH", "CN", "JP", "KR", "GB",
                            "DE", "FR", "AU", "NZ", "MY", "ID", "PH", "ES", "IT",
                            "RU", "BR", "MX", "IN", "HK", "MO", "TW"}) {
        auto result = CountryHintResolver::resolve(iso);
        ASSERT_TRUE(result.has_value()) << iso;
        EXPECT_EQ(result->iso_country, iso);
    }
}

TEST_F(CountryHintResolverTest, ResolvesPlusCallingCode) {
    auto result = CountryHintResolver::resolve("+84");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->calling_code, "84");
    EXPECT_EQ(result->iso_country, "VN");

    result = CountryHintResolver::resolve(" +852 ");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->calling_code, "852");
    EXPECT_EQ(result->iso_country, "HK");
}

TEST_F(CountryHintResolverTest, ResolvesBareCallingCode) {
    auto result = CountryHintResolver::resolve("65");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->calling_code, "65");
    EXPECT_EQ(result->iso_country, "SG");
}

TEST_F(CountryHintResolverTest, NumericSharedCodeUsesCanonicalCountry) {
    auto result = CountryHintResolver::resolve("1");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->calling_code, "1");
    EXPECT_EQ(result->iso_country, "US");
}

TEST_F(CountryHintResolverTest, RejectsUnknownCallingCode) {
    EXPECT_FALSE(CountryHintResolver::resolve("999").has_value());
    EXPECT_FALSE(CountryHintResolver::resolve("+90").has_value());
}

TEST_F(CountryHintResolverTest, RejectsTooLongCallingCode) {
    EXPECT_FALSE(CountryHintResolver::resolve("0084").has_value());
    EXPECT_FALSE(CountryHintResolver::resolve("+1234").has_value());
}

TEST_F(CountryHintResolverTest, RejectsMalformedHints) {
    EXPECT_FALSE(CountryHintResolver::resolve("").has_value());
    EXPECT_FALSE(CountryHintResolver::resolve("   ").has_value());
    EXPECT_FALSE(CountryHintResolver::resolve("+").has_value());
    EXPECT_FALSE(CountryHintResolver::resolve("+8a").has_value());
    EXPECT_FALSE(CountryHintResolver::resolve("84a").has_value());
    EXPECT_FALSE(CountryHintResolver::resolve("XX").has_value());
    EXPECT_FALSE(CountryHintResolver::resolve("VNM").has_value());
}
