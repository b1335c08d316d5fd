#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "core/DataStructs.hpp"

namespace DmrScan {

/**
 * @brief Writes pipeline results as tab-separated tables.
 *
 * Output directory layout:
 * ```
 * output/
 *   dmrs.tsv        # One row per region, candidate discovery order
 *   sites_meta.tsv  # Meta-analysis mode only: combined per-site statistics
 * ```
 */
class ResultWriter {
public:
    /**
     * @param output_dir Output root, created if missing.
     * @throws std::runtime_error if the directory cannot be created.
     */
    explicit ResultWriter(const std::string& output_dir);

    /**
     * @brief Writes regions with at least @p min_sites sites.
     *
     * Columns: chr start end n_sites estimate se z p_value p_adjust start_idx end_idx n_tests
     *
     * @return Path of the written file.
     * @throws std::runtime_error if the file cannot be written.
     */
    std::string write_dmrs(const std::vector<DmrRecord>& dmrs, int min_sites = 1,
                           const std::string& filename = "dmrs.tsv") const;

    /**
     * @brief Writes the combined per-site table.
     *
     * Columns: id chr pos estimate se z p_value
     */
    std::string write_combined_sites(const std::vector<CombinedSite>& sites,
                                     const std::string& filename = "sites_meta.tsv") const;

    /**
     * @brief Streams the region table (without filtering) to @p os.
     */
    static void format_dmrs(std::ostream& os, const std::vector<DmrRecord>& dmrs, int min_sites = 1);

private:
    std::string output_dir_;
};

}  // namespace DmrScan
