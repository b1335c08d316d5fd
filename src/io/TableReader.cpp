#include "io/TableReader.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

#include "utils/Logger.hpp"

namespace DmrScan {

// ==================================================
// TableReader Implementation
// ==================================================

TableReader::TableReader(const std::string& path) : path_(path) {
    fp_ = hts_open(path_.c_str(), "r");
    if (fp_ == NULL) {
        throw std::runtime_error("Cannot open table: " + path_);
    }
}

TableReader::~TableReader() {
    if (fp_) {
        hts_close(fp_);
    }
    free(line_.s);
}

bool TableReader::next_row(std::vector<std::string>& fields) {
    while (true) {
        int ret = hts_getline(fp_, KS_SEP_LINE, &line_);
        if (ret == -1) {
            return false;
        }
        if (ret < -1) {
            throw std::runtime_error("Read error in " + path_ + " after line " + std::to_string(line_number_));
        }
        line_number_++;

        std::string line(line_.s, line_.l);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }

        fields.clear();
        size_t start = 0;
        while (true) {
            size_t tab = line.find('\t', start);
            if (tab == std::string::npos) {
                fields.push_back(line.substr(start));
                break;
            }
            fields.push_back(line.substr(start, tab - start));
            start = tab + 1;
        }
        return true;
    }
}

// ==================================================
// Table parsing
// ==================================================

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

double parse_value(const std::string& cell) {
    std::string lower = to_lower(cell);
    if (lower.empty() || lower == "na" || lower == "nan") {
        return NAN;
    }

    char* end = nullptr;
    double value = std::strtod(cell.c_str(), &end);
    if (end == cell.c_str() || *end != '\0') {
        throw std::invalid_argument("not a number: '" + cell + "'");
    }
    return value;
}

static bool parse_integer(const std::string& cell, int64_t& value) {
    char* end = nullptr;
    long long v = std::strtoll(cell.c_str(), &end, 10);
    if (cell.empty() || *end != '\0') {
        return false;
    }
    value = static_cast<int64_t>(v);
    return true;
}

struct SiteColumns {
    int id = 0;
    int chr = 1;
    int pos = 2;
    int estimate = 3;
    int se = 4;
    int p_value = -1;
};

static SiteColumns columns_from_header(const std::vector<std::string>& header, const std::string& path) {
    SiteColumns cols;
    cols.id = cols.chr = cols.pos = cols.estimate = cols.se = -1;

    for (int i = 0; i < static_cast<int>(header.size()); ++i) {
        std::string name = to_lower(header[i]);
        if (name == "id" || name == "site" || name == "probe") cols.id = i;
        else if (name == "chr" || name == "chrom" || name == "chromosome") cols.chr = i;
        else if (name == "pos" || name == "position") cols.pos = i;
        else if (name == "estimate" || name == "beta" || name == "coef") cols.estimate = i;
        else if (name == "se" || name == "stderr") cols.se = i;
        else if (name == "p_value" || name == "p.value" || name == "p" || name == "pvalue") cols.p_value = i;
    }

    if (cols.id < 0 || cols.chr < 0 || cols.pos < 0 || cols.estimate < 0 || cols.se < 0) {
        throw std::runtime_error("Site table " + path + " header must name id, chr, pos, estimate and se columns");
    }
    return cols;
}

std::vector<Site> read_sites(const std::string& path) {
    TableReader reader(path);
    std::vector<std::string> fields;
    std::vector<Site> sites;

    if (!reader.next_row(fields)) {
        LOG_WARNING("Site table is empty: " + path);
        return sites;
    }

    // A header is present unless the third column already parses as a position
    SiteColumns cols;
    int64_t probe = 0;
    bool has_header = fields.size() < 3 || !parse_integer(fields[2], probe);
    if (has_header) {
        cols = columns_from_header(fields, path);
    } else if (fields.size() > 5) {
        cols.p_value = 5;
    }

    int max_col = std::max({cols.id, cols.chr, cols.pos, cols.estimate, cols.se, cols.p_value});

    bool pending = !has_header;
    while (pending || reader.next_row(fields)) {
        pending = false;

        const std::string where = path + ":" + std::to_string(reader.line_number());
        if (static_cast<int>(fields.size()) <= max_col) {
            throw std::runtime_error("Too few columns at " + where);
        }

        Site site;
        site.id = fields[cols.id];
        site.chr = fields[cols.chr];
        if (!parse_integer(fields[cols.pos], site.pos)) {
            throw std::runtime_error("Invalid position '" + fields[cols.pos] + "' at " + where);
        }
        try {
            site.estimate = parse_value(fields[cols.estimate]);
            site.se = parse_value(fields[cols.se]);
            if (cols.p_value >= 0) {
                site.p_value = parse_value(fields[cols.p_value]);
            }
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(std::string("Invalid value at ") + where + ": " + e.what());
        }

        sites.push_back(site);
    }

    LOG_INFO("Loaded " + std::to_string(sites.size()) + " sites from " + path);
    return sites;
}

MeasurementTable read_measurements(const std::string& path) {
    TableReader reader(path);
    std::vector<std::string> fields;
    MeasurementTable table;

    if (!reader.next_row(fields)) {
        throw std::runtime_error("Methylation matrix is empty: " + path);
    }
    table.samples.assign(fields.begin() + 1, fields.end());
    const size_t num_samples = table.samples.size();

    std::vector<std::vector<double>> rows;
    while (reader.next_row(fields)) {
        const std::string where = path + ":" + std::to_string(reader.line_number());
        if (fields.size() != num_samples + 1) {
            throw std::runtime_error("Expected " + std::to_string(num_samples + 1) + " columns at " + where +
                                     ", found " + std::to_string(fields.size()));
        }

        std::vector<double> row(num_samples);
        try {
            for (size_t j = 0; j < num_samples; ++j) {
                row[j] = parse_value(fields[j + 1]);
            }
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(std::string("Invalid value at ") + where + ": " + e.what());
        }

        table.row_ids.push_back(fields[0]);
        rows.push_back(std::move(row));
    }

    table.values.resize(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(num_samples));
    for (size_t i = 0; i < rows.size(); ++i) {
        for (size_t j = 0; j < num_samples; ++j) {
            table.values(i, j) = rows[i][j];
        }
    }

    LOG_INFO("Loaded methylation matrix " + std::to_string(rows.size()) + " x " + std::to_string(num_samples) +
             " from " + path);
    return table;
}

Eigen::MatrixXd align_measurements(const MeasurementTable& table, const std::vector<Site>& sites) {
    std::unordered_map<std::string, int> row_of;
    row_of.reserve(table.row_ids.size());
    for (size_t i = 0; i < table.row_ids.size(); ++i) {
        if (!row_of.emplace(table.row_ids[i], static_cast<int>(i)).second) {
            throw std::invalid_argument("Duplicate methylation row id: " + table.row_ids[i]);
        }
    }

    Eigen::MatrixXd aligned(static_cast<Eigen::Index>(sites.size()), table.values.cols());
    for (size_t i = 0; i < sites.size(); ++i) {
        auto it = row_of.find(sites[i].id);
        if (it == row_of.end()) {
            throw std::invalid_argument("Dimension mismatch: site " + sites[i].id + " has no methylation row");
        }
        aligned.row(static_cast<Eigen::Index>(i)) = table.values.row(it->second);
    }

    if (table.row_ids.size() > sites.size()) {
        LOG_WARNING("Ignoring " + std::to_string(table.row_ids.size() - sites.size()) +
                    " methylation rows without site statistics");
    }
    return aligned;
}

}  // namespace DmrScan
