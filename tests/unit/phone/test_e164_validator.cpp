#include <gtest/gtest.h>
#include "phone/e164_validator.h"

#include <string>

using namespace phonenorm::phone;

class E164ValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(E164ValidatorTest, PlusAloneIsInvalid) {
    EXPECT_FALSE(E164Validator::isValid("+"));
    EXPECT_FALSE(E164Validator::isValid(""));
}

TEST_F(E164ValidatorTest, MinimumLength) {
    EXPECT_TRUE(E164Validator::isValid("+1234567"));
    EXPECT_FALSE(E164Validator::isValid("+123456"));
}

TEST_F(E164ValidatorTest, MaximumLength) {
    EXPECT_TRUE(E164Validator::isValid("+" + std::string(15, '9')));
    EXPECT_FALSE(E164Validator::isValid("+" + std::string(16, '9')));
}

TEST_F(E164ValidatorTest, RequiresLeadingPlus) {
    EXPECT_FALSE(E164Validator::isValid("84912345678"));
    EXPECT_FALSE(E164Validator::isValid("0084912345678"));
}

TEST_F(E164ValidatorTest, RejectsNonDigitsAfterPlus) {
    EXPECT_FALSE(E164Validator::isValid("+84-912345678"));
    EXPECT_FALSE(E164Validator::isValid("+84 912345678"));
    EXPECT_FALSE(E164Validator::isValid("++84912345678"));
    EXPECT_FALSE(E164Validator::isValid("+84912345678a"));
}

TEST_F(E164ValidatorTest, AcceptsTypicalNumbers) {
    EXPECT_TRUE(E164Validator::isValid("+84912345678"));
    EXPECT_TRUE(E164Validator::isValid("+14155552671"));
    EXPECT_TRUE(E164Validator::isValid("+85291234567"));
}

TEST_F(E164ValidatorTest, DoesNotCheckNumberingPlan) {
    // Unknown calling code, still syntactically valid
    EXPECT_TRUE(E164Validator::isValid("+9991234567"));
}
