#pragma once

#include <string>

#include "common/logger.h"

namespace phonenorm {

/**
 * @brief Library configuration
 */
struct NormalizerConfig {
    // Country assumed for national-form input: ISO ("VN"), calling code ("84") or "+84"
    std::string default_country = "VN";

    // Logging
    LogLevel log_level = LogLevel::INFO;
};

}  // namespace phonenorm
