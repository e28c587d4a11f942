#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace phonenorm {
namespace phone {

class PhoneNormalizer;

/**
 * @brief Phone number normalized to E.164
 *
 * Invariants: e164 is '+' followed by 7-15 digits, and
 * "+" + country_code + national_number == e164.
 */
class PhoneNumber {
public:
    const std::string& raw() const { return raw_; }
    const std::string& e164() const { return e164_; }
    const std::string& countryCode() const { return country_code_; }
    const std::string& nationalNumber() const { return national_number_; }
    const std::optional<std::string>& isoCountry() const { return iso_country_; }

    bool operator==(const PhoneNumber& other) const;
    bool operator!=(const PhoneNumber& other) const { return !(*this == other); }

    nlohmann::json toJson() const;

private:
    // Only PhoneNormalizer builds numbers, after validating the assembled E.164
    friend class PhoneNormalizer;

    PhoneNumber(std::string raw, std::string country_code, std::string national_number,
                std::optional<std::string> iso_country);

    std::string raw_;              // Original input, kept for diagnostics only
    std::string e164_;             // e.g. +84912345678
    std::string country_code_;     // e.g. 84
    std::string national_number_;  // e.g. 912345678, trunk '0' removed
    std::optional<std::string> iso_country_;  // e.g. VN
};

/**
 * @brief Reason a normalization attempt produced no number
 */
enum class NormalizeError {
    EMPTY_INPUT,               // Nothing left after sanitizing
    MALFORMED_INPUT,           // '+' form with non-digits after the '+'
    UNKNOWN_COUNTRY_HINT,      // National number and the default country is not recognized
    UNKNOWN_CALLING_CODE,      // International number with no known calling code
    EMPTY_NATIONAL_NUMBER,     // Nothing left after the calling code / trunk prefix
    INVALID_ASSEMBLED_NUMBER   // Assembled number fails the E.164 syntax check
};

std::string normalizeErrorToString(NormalizeError error);

/**
 * @brief Outcome of PhoneNormalizer::normalizeDetailed()
 */
struct NormalizeResult {
    std::optional<PhoneNumber> number;
    std::optional<NormalizeError> error;

    bool ok() const { return number.has_value(); }

    static NormalizeResult success(PhoneNumber number);
    static NormalizeResult failure(NormalizeError error);

    nlohmann::json toJson() const;
};

}  // namespace phone
}  // namespace phonenorm
