#pragma once

#include <optional>
#include <string>
#include <vector>

namespace phonenorm {
namespace phone {

/**
 * @brief Static calling-code <-> ISO 3166-1 alpha-2 tables
 *
 * Built once on first use and never mutated afterwards, so every lookup is
 * safe to call from any thread. Calling codes are 1-3 digit strings.
 */
class CountryTable {
public:
    /**
     * @brief Look up the ISO country for a calling code
     * @param code Calling code (e.g. "84")
     * @return ISO alpha-2 (e.g. "VN") or nullopt if the code has no mapping
     *
     * Shared codes resolve to one canonical country ("1" -> "US").
     */
    static std::optional<std::string> codeToIso(const std::string& code);

    /**
     * @brief Look up the calling code for an ISO country
     * @param iso Upper-case ISO alpha-2 (e.g. "CA")
     * @return Calling code (e.g. "1") or nullopt if the country is unknown
     */
    static std::optional<std::string> isoToCode(const std::string& iso);

    /**
     * @brief Check whether a calling code is accepted as plausible
     */
    static bool isKnownCode(const std::string& code);

    /**
     * @brief Check whether national dialing in this country prepends a trunk '0'
     * @param iso Upper-case ISO alpha-2
     */
    static bool isTrunkZeroCountry(const std::string& iso);

    /**
     * @brief All known calling codes, sorted
     */
    static std::vector<std::string> knownCodes();

    /**
     * @brief All ISO countries with a calling code, sorted
     */
    static std::vector<std::string> isoCountries();

    // Calling codes are never longer than this
    static constexpr size_t MAX_CODE_LENGTH = 3;
};

}  // namespace phone
}  // namespace phonenorm
