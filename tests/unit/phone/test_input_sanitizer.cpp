#include <gtest/gtest.h>
#include "phone/input_sanitizer.h"

using namespace phonenorm::phone;

class InputSanitizerTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(InputSanitizerTest, StripsSeparators) {
    EXPECT_EQ(InputSanitizer::sanitize("0912 345 678"), "0912345678");
    EXPECT_EQ(InputSanitizer::sanitize("(415) 555-2671"), "4155552671");
    EXPECT_EQ(InputSanitizer::sanitize("091.234.5678"), "0912345678");
}

TEST_F(InputSanitizerTest, KeepsLeadingPlus) {
    EXPECT_EQ(InputSanitizer::sanitize("+84 912-345-678"), "+84912345678");
    EXPECT_EQ(InputSanitizer::sanitize("+"), "+");
}

TEST_F(InputSanitizerTest, DropsPlusNotInFirstPosition) {
    EXPECT_EQ(InputSanitizer::sanitize("84+912345678"), "84912345678");
    EXPECT_EQ(InputSanitizer::sanitize(" +84912345678"), "84912345678");
    EXPECT_EQ(InputSanitizer::sanitize("++84"), "+84");
}

TEST_F(InputSanitizerTest, GarbageYieldsEmpty) {
    EXPECT_EQ(InputSanitizer::sanitize(""), "");
    EXPECT_EQ(InputSanitizer::sanitize("abc-xyz"), "");
    EXPECT_EQ(InputSanitizer::sanitize("---"), "");
}

TEST_F(InputSanitizerTest, IgnoresNonAsciiDigits) {
    // Full-width digits and Arabic-Indic digits are not ASCII
    EXPECT_EQ(InputSanitizer::sanitize("\xEF\xBC\x91" "12"), "12");
    EXPECT_EQ(InputSanitizer::sanitize("\xD9\xA1" "34"), "34");
}

TEST_F(InputSanitizerTest, DigitsOnlyDropsPlus) {
    EXPECT_EQ(InputSanitizer::digitsOnly("+84 912"), "84912");
    EXPECT_EQ(InputSanitizer::digitsOnly("tel:"), "");
}
