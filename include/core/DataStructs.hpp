#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

#include "Types.hpp"

namespace DmrScan {

/**
 * @brief Association statistics for a single measured site.
 */
struct Site {
    std::string id;        ///< Unique identifier within a dataset (e.g. probe name)
    std::string chr;       ///< Chromosome name
    int64_t pos = 0;       ///< Genomic position
    double estimate = 0.0; ///< Effect estimate
    double se = 1.0;       ///< Standard error (> 0)
    double p_value = std::numeric_limits<double>::quiet_NaN();  ///< NaN until derived

    bool has_p_value() const { return !std::isnan(p_value); }
};

/**
 * @brief Maximal run of qualifying sites, as an inclusive index span.
 */
struct CandidateRegion {
    int start_idx = 0;
    int end_idx = 0;

    int size() const { return end_idx - start_idx + 1; }
};

/**
 * @brief Fixed-effect combination of a set of estimates.
 *
 * B is the combined estimate, S its variance.
 */
struct MetaStats {
    double B = 0.0;
    double S = 1.0;

    /// Conservative result used when a span cannot be combined.
    static MetaStats null() { return MetaStats{0.0, 1.0}; }

    double z() const { return B / std::sqrt(S); }
};

/**
 * @brief MetaStats expanded into the reported quantities.
 */
struct MetaResult {
    double estimate = 0.0;
    double se = 1.0;
    double z = 0.0;
    double p_value = 1.0;
};

/**
 * @brief Sub-span chosen by the shrinker for one candidate.
 */
struct ShrunkRegion {
    int start_idx = 0;
    int end_idx = 0;
    double z = 0.0;   ///< Score of the chosen sub-span (0 when not evaluated)
    int n_tests = 0;  ///< Number of score evaluations spent on this candidate
    int n_steps = 0;  ///< Number of accepted trims

    int size() const { return end_idx - start_idx + 1; }
};

/**
 * @brief Final per-region output record.
 */
struct DmrRecord {
    std::string chr;
    int64_t start = 0;     ///< Position of the first constituent site
    int64_t end = 0;       ///< Position of the last constituent site
    int n_sites = 0;
    double estimate = 0.0;
    double se = 1.0;
    double z = 0.0;
    double p_value = 1.0;
    double p_adjust = 1.0;
    int start_idx = 0;     ///< Index of the first site in the sorted site table
    int end_idx = 0;       ///< Index of the last site in the sorted site table
    int n_tests = 0;       ///< Shrinker evaluations spent on the candidate
};

/**
 * @brief Per-site statistics combined across datasets.
 */
struct CombinedSite {
    std::string id;
    std::string chr;
    int64_t pos = 0;
    double estimate = 0.0;
    double se = 1.0;
    double z = 0.0;
    double p_value = 1.0;
};

}  // namespace DmrScan
