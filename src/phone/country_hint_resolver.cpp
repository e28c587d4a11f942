#include "phone/country_hint_resolver.h"

#include <algorithm>
#include <cctype>

#include "phone/country_table.h"

namespace phonenorm {
namespace phone {

namespace {

bool isAllDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

}  // namespace

std::optional<CountryHint> CountryHintResolver::resolve(const std::string& hint) {
    std::string up = normalizeHint(hint);

    // "+84"
    if (!up.empty() && up[0] == '+') {
        return fromCallingCode(up.substr(1));
    }

    // "84"
    if (isAllDigits(up)) {
        return fromCallingCode(up);
    }

    // "VN"
    if (auto code = CountryTable::isoToCode(up)) {
        return CountryHint{*code, up};
    }

    return std::nullopt;
}

std::string CountryHintResolver::normalizeHint(const std::string& hint) {
    size_t start = 0;
    size_t end = hint.length();
    while (start < end && std::isspace(static_cast<unsigned char>(hint[start]))) {
        start++;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(hint[end - 1]))) {
        end--;
    }

    std::string result = hint.substr(start, end - start);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::optional<CountryHint> CountryHintResolver::fromCallingCode(const std::string& code) {
    if (!isAllDigits(code) || code.length() > CountryTable::MAX_CODE_LENGTH) {
        return std::nullopt;
    }
    if (!CountryTable::isKnownCode(code)) {
        return std::nullopt;
    }
    return CountryHint{code, CountryTable::codeToIso(code)};
}

}  // namespace phone
}  // namespace phonenorm
