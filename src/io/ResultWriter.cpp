#include "io/ResultWriter.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <stdexcept>

#include "utils/Logger.hpp"

namespace DmrScan {

ResultWriter::ResultWriter(const std::string& output_dir) : output_dir_(output_dir) {
    std::error_code ec;
    std::filesystem::create_directories(output_dir_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create output directory " + output_dir_ + ": " + ec.message());
    }
}

void ResultWriter::format_dmrs(std::ostream& os, const std::vector<DmrRecord>& dmrs, int min_sites) {
    os << "chr\tstart\tend\tn_sites\testimate\tse\tz\tp_value\tp_adjust\tstart_idx\tend_idx\tn_tests\n";
    for (const auto& dmr : dmrs) {
        if (dmr.n_sites < min_sites) {
            continue;
        }
        os << dmr.chr << "\t" << dmr.start << "\t" << dmr.end << "\t" << dmr.n_sites << "\t"
           << std::setprecision(6) << dmr.estimate << "\t" << dmr.se << "\t" << dmr.z << "\t"
           << std::setprecision(4) << std::scientific << dmr.p_value << "\t" << dmr.p_adjust
           << std::defaultfloat << "\t" << dmr.start_idx << "\t" << dmr.end_idx << "\t" << dmr.n_tests << "\n";
    }
}

std::string ResultWriter::write_dmrs(const std::vector<DmrRecord>& dmrs, int min_sites,
                                     const std::string& filename) const {
    std::string path = output_dir_ + "/" + filename;
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }

    format_dmrs(ofs, dmrs, min_sites);

    if (!ofs) {
        throw std::runtime_error("Failed while writing " + path);
    }
    LOG_INFO("Wrote regions to " + path);
    return path;
}

std::string ResultWriter::write_combined_sites(const std::vector<CombinedSite>& sites,
                                               const std::string& filename) const {
    std::string path = output_dir_ + "/" + filename;
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }

    ofs << "id\tchr\tpos\testimate\tse\tz\tp_value\n";
    for (const auto& site : sites) {
        ofs << site.id << "\t" << site.chr << "\t" << site.pos << "\t" << std::setprecision(6) << site.estimate
            << "\t" << site.se << "\t" << site.z << "\t" << std::setprecision(4) << std::scientific << site.p_value
            << std::defaultfloat << "\n";
    }

    if (!ofs) {
        throw std::runtime_error("Failed while writing " + path);
    }
    LOG_INFO("Wrote " + std::to_string(sites.size()) + " combined sites to " + path);
    return path;
}

}  // namespace DmrScan
