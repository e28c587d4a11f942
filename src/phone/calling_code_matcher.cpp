#include "phone/calling_code_matcher.h"

#include "phone/country_table.h"

namespace phonenorm {
namespace phone {

std::optional<CallingCodeMatch> CallingCodeMatcher::match(const std::string& digits) {
    // Try 3-digit codes first, then 2-digit, then 1-digit
    for (size_t len = CountryTable::MAX_CODE_LENGTH; len >= 1; --len) {
        if (digits.length() < len) {
            continue;
        }

        std::string prefix = digits.substr(0, len);
        if (auto iso = CountryTable::codeToIso(prefix)) {
            return CallingCodeMatch{prefix, iso};
        }
        if (CountryTable::isKnownCode(prefix)) {
            return CallingCodeMatch{prefix, std::nullopt};
        }
    }
    return std::nullopt;
}

}  // namespace phone
}  // namespace phonenorm
