#pragma once

#include <optional>
#include <string>

namespace phonenorm {
namespace phone {

/**
 * @brief Default country resolved from a caller-supplied hint
 */
struct CountryHint {
    std::string calling_code;
    std::optional<std::string> iso_country;
};

class CountryHintResolver {
public:
    /**
     * @brief Interpret a default-country hint
     * @param hint "+84", "84" or an ISO alpha-2 code such as "vn" (trimmed, case-insensitive)
     * @return Calling code and ISO country, or nullopt if the hint is not recognized
     *
     * Numeric hints must name a known calling code; a shared code picks the
     * canonical country ("1" -> "US") while an ISO hint keeps its own
     * country ("CA" -> {"1", "CA"}).
     */
    static std::optional<CountryHint> resolve(const std::string& hint);

private:
    static std::string normalizeHint(const std::string& hint);
    static std::optional<CountryHint> fromCallingCode(const std::string& code);
};

}  // namespace phone
}  // namespace phonenorm
