#pragma once

#include <optional>
#include <string>

namespace phonenorm {
namespace phone {

/**
 * @brief Calling code found at the start of a digit string
 */
struct CallingCodeMatch {
    std::string calling_code;               // 1-3 digits
    std::optional<std::string> iso_country; // empty if the code has no ISO mapping
};

class CallingCodeMatcher {
public:
    /**
     * @brief Find the longest calling-code prefix of a digit string
     * @param digits Digits following '+' (e.g. "85291234567")
     * @return Match (e.g. {"852", "HK"}) or nullopt if no 1-3 digit prefix is known
     *
     * Prefix lengths are tried 3, 2, 1 so that "852" is never shadowed by a
     * shorter code. A known code without an ISO mapping matches with an empty
     * iso_country; the built-in table currently maps every known code.
     */
    static std::optional<CallingCodeMatch> match(const std::string& digits);
};

}  // namespace phone
}  // namespace phonenorm
