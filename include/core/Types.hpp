#pragma once

#include <cstdint>
#include <string>

namespace DmrScan {

/**
 * @brief Log level for controlling output verbosity.
 */
enum class LogLevel {
    LOG_ERROR = 0,    ///< Only errors
    LOG_WARN = 1,     ///< Errors and warnings
    LOG_INFO = 2,     ///< Normal operational messages
    LOG_DEBUG = 3     ///< Detailed debug output
};

/**
 * @brief Multiple-testing correction applied to region p-values.
 */
enum class AdjustMethod {
    BONFERRONI,  ///< p * n, capped at 1
    FDR          ///< Benjamini-Hochberg step-up over n tests
};

/**
 * @brief Direction of a site's effect estimate.
 *
 * A candidate region only contains sites sharing one direction.
 */
enum class EffectSign : int8_t {
    NEGATIVE = -1,  ///< estimate < 0
    ZERO = 0,       ///< estimate == 0, only joins other zero estimates
    POSITIVE = 1    ///< estimate > 0
};

inline EffectSign sign_of(double estimate) {
    if (estimate > 0.0) return EffectSign::POSITIVE;
    if (estimate < 0.0) return EffectSign::NEGATIVE;
    return EffectSign::ZERO;
}

inline std::string adjust_method_to_string(AdjustMethod method) {
    switch (method) {
        case AdjustMethod::BONFERRONI: return "bonferroni";
        case AdjustMethod::FDR: return "fdr";
        default: return "unknown";
    }
}

} // namespace DmrScan
