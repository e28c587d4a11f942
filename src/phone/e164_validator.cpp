#include "phone/e164_validator.h"

namespace phonenorm {
namespace phone {

bool E164Validator::isValid(const std::string& candidate) {
    if (candidate.empty() || candidate[0] != '+') {
        return false;
    }

    size_t digits = candidate.length() - 1;
    if (digits < MIN_DIGITS || digits > MAX_DIGITS) {
        return false;
    }

    for (size_t i = 1; i < candidate.length(); ++i) {
        if (candidate[i] < '0' || candidate[i] > '9') {
            return false;
        }
    }
    return true;
}

}  // namespace phone
}  // namespace phonenorm
