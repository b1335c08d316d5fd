#include "core/Config.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace DmrScan {

static bool check_readable(const std::string& label, const std::string& path) {
    if (!std::filesystem::is_regular_file(path)) {
        std::cerr << "Error: " << label << " not found: " << path << std::endl;
        return false;
    }
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        std::cerr << "Error: Cannot open " << label << ": " << path << std::endl;
        return false;
    }
    return true;
}

bool Config::validate() const {
    bool valid = true;

    if (site_paths.empty()) {
        std::cerr << "Error: At least one site statistics file is required." << std::endl;
        valid = false;
    }

    if (methylation_paths.size() != site_paths.size()) {
        std::cerr << "Error: Expected one methylation matrix per site file (" << site_paths.size()
                  << " site files, " << methylation_paths.size() << " matrices)." << std::endl;
        valid = false;
    }

    for (const auto& path : site_paths) {
        if (!check_readable("site statistics file", path)) {
            valid = false;
        }
    }
    for (const auto& path : methylation_paths) {
        if (!check_readable("methylation matrix", path)) {
            valid = false;
        }
    }

    if (max_gap < 0) {
        std::cerr << "Error: max_gap must be non-negative." << std::endl;
        valid = false;
    }

    if (p_cutoff <= 0.0 || p_cutoff > 1.0) {
        std::cerr << "Error: p_cutoff must be in (0, 1]." << std::endl;
        valid = false;
    }

    if (window < 1) {
        std::cerr << "Error: window must be at least 1." << std::endl;
        valid = false;
    }

    if (regularizer < 1.0) {
        std::cerr << "Error: regularizer must be at least 1.0." << std::endl;
        valid = false;
    }

    if (min_sites < 1) {
        std::cerr << "Error: min_sites must be at least 1." << std::endl;
        valid = false;
    }

    return valid;
}

void Config::print() const {
    std::cout << "--- Configuration ---" << std::endl;
    std::cout << "Mode: " << (is_meta() ? "meta-analysis" : "single dataset") << std::endl;
    for (size_t i = 0; i < site_paths.size(); ++i) {
        std::cout << "Dataset " << (i + 1) << ": " << site_paths[i];
        if (i < methylation_paths.size()) {
            std::cout << " + " << methylation_paths[i];
        }
        std::cout << std::endl;
    }
    std::cout << "Output Dir: " << output_dir << std::endl;
    std::cout << "Max Gap: " << max_gap << std::endl;
    std::cout << "P-value Cutoff: " << p_cutoff << std::endl;
    std::cout << "Correlation Window: " << window << std::endl;
    std::cout << "Regularizer: " << regularizer << std::endl;
    std::cout << "Adjustment: " << adjust_method_to_string(adjust_method) << std::endl;
    std::cout << "Min Sites: " << min_sites << std::endl;
    std::cout << "Threads: " << threads << std::endl;
    std::cout << "---------------------" << std::endl;
}

} // namespace DmrScan
