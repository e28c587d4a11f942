#pragma once

#include <string>

namespace phonenorm {
namespace phone {

class InputSanitizer {
public:
    /**
     * @brief Strip everything but ASCII digits, keeping a leading '+'
     * @param input Raw user input (e.g. "+84 (912) 345-678")
     * @return Sanitized string (e.g. "+84912345678"), empty for garbage input
     *
     * A '+' is kept only when it is the very first character of the input;
     * a '+' anywhere else is dropped like any other separator.
     */
    static std::string sanitize(const std::string& input);

    /**
     * @brief Keep ASCII digits only
     */
    static std::string digitsOnly(const std::string& input);
};

}  // namespace phone
}  // namespace phonenorm
