#pragma once

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "Types.hpp"

namespace DmrScan {

/**
 * @brief Configuration structure holding all runtime parameters.
 *
 * Stores paths to input/output files and the region-calling thresholds.
 * Validated by both CLI11 (basic checks) and internal validate() method (cross-field logic).
 */
struct Config {
    // Input/Output
    std::vector<std::string> site_paths;         ///< Per-dataset site statistics TSV (Required, one per dataset)
    std::vector<std::string> methylation_paths;  ///< Per-dataset measurement matrix TSV (one per sites file)
    std::string output_dir = "output";           ///< Output directory for result tables

    // Region calling
    int64_t max_gap = 500;       ///< Maximum distance between consecutive sites in a region
    double p_cutoff = 0.05;      ///< Unadjusted p-value cutoff for candidate membership
    int window = 20;             ///< Correlation bandwidth W (neighbours per site)
    double regularizer = 1.05;   ///< Diagonal of reconstructed correlation blocks
    AdjustMethod adjust_method = AdjustMethod::BONFERRONI;  ///< Multiplicity correction
    int min_sites = 1;           ///< Minimum sites for a region to be written

    int threads = 4;             ///< Number of threads for parallel processing

    // Logging
    LogLevel log_level = LogLevel::LOG_INFO;  ///< Logging verbosity level
    std::string log_file = "";                ///< Optional log file (appended)

    /**
     * @brief Validates configuration logic and input files.
     *
     * Performs checks that CLI11 cannot handle, such as:
     * - One measurement matrix per site table
     * - Input files exist and are readable
     * - Threshold ranges (p_cutoff in (0,1], regularizer >= 1)
     *
     * @return true if configuration is valid, false otherwise.
     */
    bool validate() const;

    /**
     * @brief Prints the current configuration to stdout.
     */
    void print() const;

    /**
     * @brief True when more than one dataset is configured.
     */
    bool is_meta() const {
        return site_paths.size() > 1;
    }

    /**
     * @brief Check if debug mode is enabled.
     */
    bool is_debug() const {
        return log_level >= LogLevel::LOG_DEBUG;
    }
};

}  // namespace DmrScan
