#include "phone/input_sanitizer.h"

namespace phonenorm {
namespace phone {

namespace {

bool isAsciiDigit(char c) {
    return c >= '0' && c <= '9';
}

}  // namespace

std::string InputSanitizer::sanitize(const std::string& input) {
    std::string result;
    result.reserve(input.length());

    for (size_t i = 0; i < input.length(); ++i) {
        char c = input[i];
        if (isAsciiDigit(c) || (c == '+' && i == 0)) {
            result += c;
        }
    }
    return result;
}

std::string InputSanitizer::digitsOnly(const std::string& input) {
    std::string result;
    result.reserve(input.length());

    for (char c : input) {
        if (isAsciiDigit(c)) {
            result += c;
        }
    }
    return result;
}

}  // namespace phone
}  // namespace phonenorm
