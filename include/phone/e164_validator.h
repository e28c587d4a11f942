#pragma once

#include <string>

namespace phonenorm {
namespace phone {

class E164Validator {
public:
    /**
     * @brief Syntax-only E.164 check
     * @param candidate String to check (e.g. "+84912345678")
     * @return true if candidate is '+' followed by 7-15 ASCII digits
     *
     * Does not check the calling code or the national number against any
     * numbering plan.
     */
    static bool isValid(const std::string& candidate);

    static constexpr size_t MIN_DIGITS = 7;
    static constexpr size_t MAX_DIGITS = 15;
};

}  // namespace phone
}  // namespace phonenorm
