#include "phone/phone_number.h"

#include <utility>

namespace phonenorm {
namespace phone {

PhoneNumber::PhoneNumber(std::string raw, std::string country_code, std::string national_number,
                         std::optional<std::string> iso_country)
    : raw_(std::move(raw)),
      e164_("+" + country_code + national_number),
      country_code_(std::move(country_code)),
      national_number_(std::move(national_number)),
      iso_country_(std::move(iso_country)) {}

bool PhoneNumber::operator==(const PhoneNumber& other) const {
    return raw_ == other.raw_ && e164_ == other.e164_ && country_code_ == other.country_code_ &&
           national_number_ == other.national_number_ && iso_country_ == other.iso_country_;
}

nlohmann::json PhoneNumber::toJson() const {
    nlohmann::json j;
    j["raw"] = raw_;
    j["e164"] = e164_;
    j["country_code"] = country_code_;
    j["national_number"] = national_number_;
    if (iso_country_.has_value()) {
        j["iso_country"] = iso_country_.value();
    } else {
        j["iso_country"] = nullptr;
    }
    return j;
}

std::string normalizeErrorToString(NormalizeError error) {
    switch (error) {
        case NormalizeError::EMPTY_INPUT:
            return "EMPTY_INPUT";
        case NormalizeError::MALFORMED_INPUT:
            return "MALFORMED_INPUT";
        case NormalizeError::UNKNOWN_COUNTRY_HINT:
            return "UNKNOWN_COUNTRY_HINT";
        case NormalizeError::UNKNOWN_CALLING_CODE:
            return "UNKNOWN_CALLING_CODE";
        case NormalizeError::EMPTY_NATIONAL_NUMBER:
            return "EMPTY_NATIONAL_NUMBER";
        case NormalizeError::INVALID_ASSEMBLED_NUMBER:
            return "INVALID_ASSEMBLED_NUMBER";
    }
    return "UNKNOWN";
}

NormalizeResult NormalizeResult::success(PhoneNumber number) {
    NormalizeResult result;
    result.number = std::move(number);
    return result;
}

NormalizeResult NormalizeResult::failure(NormalizeError error) {
    NormalizeResult result;
    result.error = error;
    return result;
}

nlohmann::json NormalizeResult::toJson() const {
    nlohmann::json j;
    j["ok"] = ok();
    if (number.has_value()) {
        j["number"] = number->toJson();
    }
    if (error.has_value()) {
        j["error"] = normalizeErrorToString(error.value());
    }
    return j;
}

}  // namespace phone
}  // namespace phonenorm
