#pragma once

#include <CLI/CLI.hpp>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <string>

#include "core/Config.hpp"

namespace DmrScan {
namespace Utils {

/**
 * @brief Command-line argument parser wrapper around CLI11.
 */
class ArgParser {
public:
    /**
     * @brief Parses command line arguments and populates the Config object.
     *
     * Uses CLI11 to handle argument parsing, type conversion, and basic validation
     * (e.g., file existence, numeric ranges).
     *
     * @param argc Argument count.
     * @param argv Argument values.
     * @param config Reference to Config object to populate.
     * @return true if parsing was successful and execution should continue.
     * @return false if parsing failed or help was requested (execution should stop).
     */
    static bool parse(int argc, char** argv, Config& config) {
        CLI::App app{"dmrscan - Differentially methylated regions from per-site association statistics"};

        // Input/Output
        app.add_option("-s,--sites", config.site_paths,
            "Site statistics TSV: id chr pos estimate se [p_value] (Required, repeat once per dataset)")
            ->required()
            ->check(CLI::ExistingFile);

        app.add_option("-m,--methylation", config.methylation_paths,
            "Methylation matrix TSV: id sample1 sample2 ... (one per --sites, same order)")
            ->required()
            ->check(CLI::ExistingFile);

        app.add_option("-o,--output-dir", config.output_dir, "Output Directory (Default: output)");

        // Region calling
        app.add_option("-g,--max-gap", config.max_gap, "Maximum distance between consecutive sites (Default: 500)")
            ->check(CLI::NonNegativeNumber);

        app.add_option("-p,--p-cutoff", config.p_cutoff, "Unadjusted p-value cutoff for candidates (Default: 0.05)")
            ->check(CLI::Range(0.0, 1.0));

        app.add_option("-W,--window", config.window, "Correlation window in sites (Default: 20)")
            ->check(CLI::PositiveNumber);

        app.add_option("--regularizer", config.regularizer,
            "Diagonal of correlation blocks (Default: 1.05)")
            ->check(CLI::Range(1.0, 10.0));

        std::string adjust_str = "bonferroni";
        app.add_option("--adjust", adjust_str, "Multiple testing correction: bonferroni, fdr (Default: bonferroni)")
            ->check(CLI::IsMember({"bonferroni", "fdr"}, CLI::ignore_case));

        app.add_option("--min-sites", config.min_sites, "Minimum sites for a region to be written (Default: 1)")
            ->check(CLI::PositiveNumber);

        app.add_option("-j,--threads", config.threads, "Number of threads (Default: 4)")
            ->check(CLI::PositiveNumber);

        // Logging
        std::string log_level_str = "info";
        app.add_option("--log-level", log_level_str,
            "Logging level: error, warn, info, debug (Default: info)")
            ->check(CLI::IsMember({"error", "warn", "info", "debug"}, CLI::ignore_case));

        app.add_option("--log-file", config.log_file, "Append log messages to this file");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            // If help is requested (ret=0) or error occurs (ret>0), we print message and return false.
            app.exit(e);
            return false;
        }

        // Convert log level string to enum
        static const std::map<std::string, LogLevel> log_level_map = {
            {"error", LogLevel::LOG_ERROR},
            {"warn", LogLevel::LOG_WARN},
            {"info", LogLevel::LOG_INFO},
            {"debug", LogLevel::LOG_DEBUG}
        };

        auto it = log_level_map.find(to_lower(log_level_str));
        if (it != log_level_map.end()) {
            config.log_level = it->second;
        }

        static const std::map<std::string, AdjustMethod> adjust_map = {
            {"bonferroni", AdjustMethod::BONFERRONI},
            {"fdr", AdjustMethod::FDR}
        };

        auto ait = adjust_map.find(to_lower(adjust_str));
        if (ait != adjust_map.end()) {
            config.adjust_method = ait->second;
        }

        return true;
    }

private:
    static std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }
};

} // namespace Utils
} // namespace DmrScan
