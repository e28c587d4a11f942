#pragma once

#include <optional>
#include <string>

#include "common/types.h"
#include "phone/phone_number.h"

namespace phonenorm {
namespace phone {

class PhoneNormalizer {
public:
    /**
     * @brief Normalize user-typed phone number to E.164
     * @param input Raw input ("0912 345 678", "+84 912-345-678", "0084 912 345 678", ...)
     * @param default_country Country for national-form input: ISO ("VN"), calling code ("84") or "+84"
     * @return Normalized number or nullopt if the input cannot be normalized
     *
     * International input ('+' or "00" prefix) carries its own calling code
     * and ignores default_country.
     */
    static std::optional<PhoneNumber> normalize(const std::string& input,
                                                const std::string& default_country);

    /**
     * @brief Normalize using the configured default country
     */
    static std::optional<PhoneNumber> normalize(const std::string& input,
                                                const NormalizerConfig& config);

    /**
     * @brief Same as normalize(), but reports why normalization failed
     */
    static NormalizeResult normalizeDetailed(const std::string& input,
                                             const std::string& default_country);

    /**
     * @brief Normalize assuming Vietnam as default country
     * @return E.164 string or nullopt
     */
    static std::optional<std::string> normalizeVnPhone(const std::string& input);

    /**
     * @brief Normalize the number carried by a TEL URI
     * @param uri e.g. "tel:+84-912-345-678;phone-context=example.com"
     * @param default_country Used when the URI holds a local number
     * @return Normalized number or nullopt if uri is not a tel: URI or holds no valid number
     */
    static std::optional<PhoneNumber> fromTelUri(const std::string& uri,
                                                 const std::string& default_country);

    /**
     * @brief Best-effort ISO country of an E.164 number
     * @param e164 e.g. "+85291234567"
     * @return ISO alpha-2 (e.g. "HK") or nullopt if invalid or the calling code is unknown
     *
     * A matched code without ISO is looked up once more in the code table;
     * with the built-in table every matched code already carries its ISO.
     */
    static std::optional<std::string> detectCountry(const std::string& e164);

    /**
     * @brief Syntax-only E.164 check, see E164Validator::isValid()
     */
    static bool isValidE164(const std::string& candidate);

    static constexpr const char* VIETNAM = "VN";

private:
    static NormalizeResult normalizeInternational(const std::string& raw,
                                                  const std::string& plus_form);
    static NormalizeResult normalizeNational(const std::string& raw, const std::string& sanitized,
                                             const std::string& default_country);
    static NormalizeResult assemble(const std::string& raw, const std::string& calling_code,
                                    std::string national_number,
                                    const std::optional<std::string>& iso_country);
    static std::string stripTrunkZero(const std::string& national_number,
                                      const std::optional<std::string>& iso_country);
};

}  // namespace phone
}  // namespace phonenorm
