#include "phone/phone_normalizer.h"

#include <algorithm>
#include <cctype>
#include <utility>

#include "common/logger.h"
#include "phone/calling_code_matcher.h"
#include "phone/country_hint_resolver.h"
#include "phone/country_table.h"
#include "phone/e164_validator.h"
#include "phone/input_sanitizer.h"

namespace phonenorm {
namespace phone {

namespace {

// Value of a ";name=value" URI parameter, empty if absent. Names are case-insensitive.
std::string uriParameter(const std::string& params, const std::string& name) {
    size_t start = 0;
    while (start <= params.length()) {
        size_t end = params.find(';', start);
        if (end == std::string::npos) {
            end = params.length();
        }

        std::string param = params.substr(start, end - start);
        size_t eq_pos = param.find('=');
        std::string key = param.substr(0, eq_pos);
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (key == name && eq_pos != std::string::npos) {
            return param.substr(eq_pos + 1);
        }
        start = end + 1;
    }
    return "";
}

}  // namespace

std::optional<PhoneNumber> PhoneNormalizer::normalize(const std::string& input,
                                                      const std::string& default_country) {
    NormalizeResult result = normalizeDetailed(input, default_country);
    if (!result.ok()) {
        LOG_DEBUG("Cannot normalize '{}' (default country '{}'): {}", input, default_country,
                  normalizeErrorToString(*result.error));
        return std::nullopt;
    }
    return result.number;
}

std::optional<PhoneNumber> PhoneNormalizer::normalize(const std::string& input,
                                                      const NormalizerConfig& config) {
    return normalize(input, config.default_country);
}

NormalizeResult PhoneNormalizer::normalizeDetailed(const std::string& input,
                                                   const std::string& default_country) {
    std::string sanitized = InputSanitizer::sanitize(input);
    if (sanitized.empty()) {
        return NormalizeResult::failure(NormalizeError::EMPTY_INPUT);
    }

    if (sanitized[0] == '+') {
        return normalizeInternational(input, sanitized);
    }

    // "00" is the ITU international prefix, same as '+'
    if (sanitized.compare(0, 2, "00") == 0) {
        return normalizeInternational(input, "+" + sanitized.substr(2));
    }

    return normalizeNational(input, sanitized, default_country);
}

std::optional<std::string> PhoneNormalizer::normalizeVnPhone(const std::string& input) {
    auto number = normalize(input, VIETNAM);
    if (!number) {
        return std::nullopt;
    }
    return number->e164();
}

std::optional<PhoneNumber> PhoneNormalizer::fromTelUri(const std::string& uri,
                                                       const std::string& default_country) {
    std::string working = uri;

    // Scheme is case-insensitive
    std::string scheme = working.substr(0, 4);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (scheme != "tel:") {
        return std::nullopt;
    }
    working = working.substr(4);

    // Split off parameters (everything after first ;)
    std::string params;
    size_t semi_pos = working.find(';');
    if (semi_pos != std::string::npos) {
        params = working.substr(semi_pos + 1);
        working = working.substr(0, semi_pos);
    }

    // TEL URIs typically use visual separators
    working.erase(std::remove_if(working.begin(), working.end(),
        [](unsigned char c) {
            return c == '-' || c == '.' || c == '(' || c == ')' || std::isspace(c);
        }),
        working.end());

    // A local number takes its country from a global phone-context ("+84", "+1-212")
    std::string country = default_country;
    std::string context = uriParameter(params, "phone-context");
    if (!context.empty() && context[0] == '+') {
        auto match = CallingCodeMatcher::match(InputSanitizer::digitsOnly(context));
        country = match ? "+" + match->calling_code : context;
    }

    NormalizeResult result = normalizeDetailed(working, country);
    if (!result.ok()) {
        LOG_DEBUG("Cannot normalize TEL URI '{}': {}", uri, normalizeErrorToString(*result.error));
        return std::nullopt;
    }

    // Report the URI itself as the raw input
    const PhoneNumber& number = *result.number;
    return PhoneNumber(uri, number.countryCode(), number.nationalNumber(), number.isoCountry());
}

std::optional<std::string> PhoneNormalizer::detectCountry(const std::string& e164) {
    if (!E164Validator::isValid(e164)) {
        return std::nullopt;
    }

    auto match = CallingCodeMatcher::match(e164.substr(1));
    if (!match) {
        return std::nullopt;
    }
    if (match->iso_country) {
        return match->iso_country;
    }
    return CountryTable::codeToIso(match->calling_code);
}

bool PhoneNormalizer::isValidE164(const std::string& candidate) {
    return E164Validator::isValid(candidate);
}

NormalizeResult PhoneNormalizer::normalizeInternational(const std::string& raw,
                                                        const std::string& plus_form) {
    std::string digits = plus_form.substr(1);
    if (InputSanitizer::digitsOnly(digits) != digits) {
        return NormalizeResult::failure(NormalizeError::MALFORMED_INPUT);
    }

    auto match = CallingCodeMatcher::match(digits);
    if (!match) {
        return NormalizeResult::failure(NormalizeError::UNKNOWN_CALLING_CODE);
    }

    // A redundant trunk '0' typed after the calling code is tolerated
    std::string national = stripTrunkZero(digits.substr(match->calling_code.length()),
                                          match->iso_country);
    return assemble(raw, match->calling_code, std::move(national), match->iso_country);
}

NormalizeResult PhoneNormalizer::normalizeNational(const std::string& raw,
                                                   const std::string& sanitized,
                                                   const std::string& default_country) {
    auto hint = CountryHintResolver::resolve(default_country);
    if (!hint) {
        return NormalizeResult::failure(NormalizeError::UNKNOWN_COUNTRY_HINT);
    }

    std::string national = stripTrunkZero(InputSanitizer::digitsOnly(sanitized), hint->iso_country);
    return assemble(raw, hint->calling_code, std::move(national), hint->iso_country);
}

NormalizeResult PhoneNormalizer::assemble(const std::string& raw, const std::string& calling_code,
                                          std::string national_number,
                                          const std::optional<std::string>& iso_country) {
    if (national_number.empty()) {
        return NormalizeResult::failure(NormalizeError::EMPTY_NATIONAL_NUMBER);
    }

    PhoneNumber number(raw, calling_code, std::move(national_number), iso_country);
    if (!E164Validator::isValid(number.e164())) {
        return NormalizeResult::failure(NormalizeError::INVALID_ASSEMBLED_NUMBER);
    }

    LOG_TRACE("Normalized '{}' -> {}", raw, number.e164());
    return NormalizeResult::success(std::move(number));
}

std::string PhoneNormalizer::stripTrunkZero(const std::string& national_number,
                                            const std::optional<std::string>& iso_country) {
    if (!iso_country || !CountryTable::isTrunkZeroCountry(*iso_country)) {
        return national_number;
    }
    // Only one '0' is removed; further zeros are kept as typed
    if (!national_number.empty() && national_number[0] == '0') {
        return national_number.substr(1);
    }
    return national_number;
}

}  // namespace phone
}  // namespace phonenorm
