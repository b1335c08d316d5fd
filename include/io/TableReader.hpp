#pragma once

#include <htslib/hts.h>
#include <htslib/kstring.h>

#include <string>
#include <vector>
#include <Eigen/Dense>

#include "core/DataStructs.hpp"

namespace DmrScan {

/**
 * @brief Line reader for tab-delimited tables, plain or bgzip/gzip compressed.
 *
 * Wraps htslib's hts_open/hts_getline so compressed and uncompressed
 * inputs are handled alike. Blank lines and lines starting with '#' are skipped.
 */
class TableReader {
public:
    /**
     * @throws std::runtime_error if the file cannot be opened.
     */
    explicit TableReader(const std::string& path);
    ~TableReader();

    TableReader(const TableReader&) = delete;
    TableReader& operator=(const TableReader&) = delete;

    /**
     * @brief Reads the next non-empty line and splits it on tabs.
     *
     * @return false at end of file.
     * @throws std::runtime_error on a read error.
     */
    bool next_row(std::vector<std::string>& fields);

    int line_number() const { return line_number_; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    htsFile* fp_ = nullptr;
    kstring_t line_ = {0, 0, nullptr};
    int line_number_ = 0;
};

/**
 * @brief Measurement matrix as read from disk, rows keyed by site id.
 */
struct MeasurementTable {
    std::vector<std::string> row_ids;
    std::vector<std::string> samples;
    Eigen::MatrixXd values;  ///< rows = row_ids, cols = samples, NaN = missing
};

/**
 * @brief Parses a numeric cell; "NA", "NaN" and empty cells give NaN.
 *
 * @throws std::invalid_argument if the cell is not a number.
 */
double parse_value(const std::string& cell);

/**
 * @brief Reads a site statistics table.
 *
 * With a header, columns are located by name (id, chr, pos, estimate, se and
 * optionally p_value / p.value / p); without one they are taken in that order.
 *
 * @throws std::runtime_error with file and line on malformed rows.
 */
std::vector<Site> read_sites(const std::string& path);

/**
 * @brief Reads a measurement matrix: header "id sample...", then one row per site.
 *
 * @throws std::runtime_error with file and line on malformed rows.
 */
MeasurementTable read_measurements(const std::string& path);

/**
 * @brief Reorders matrix rows to follow @p sites by id.
 *
 * @throws std::invalid_argument if a site has no row, or ids repeat.
 */
Eigen::MatrixXd align_measurements(const MeasurementTable& table, const std::vector<Site>& sites);

}  // namespace DmrScan
