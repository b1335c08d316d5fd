#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "DataStructs.hpp"

namespace DmrScan {

/**
 * @brief Thresholds that define candidate region membership.
 */
struct CandidateConfig {
    double p_cutoff = 0.05;  ///< Sites need p < p_cutoff
    int64_t max_gap = 500;   ///< Maximum distance between consecutive sites
};

/**
 * @brief Partitions sorted sites into maximal candidate regions.
 *
 * A candidate is a maximal run of consecutive sites that all have
 * p < p_cutoff, share the sign of their estimates, lie on one chromosome
 * and are at most max_gap apart from their predecessor.
 */
class CandidateDetector {
public:
    explicit CandidateDetector(const CandidateConfig& config = CandidateConfig()) : config_(config) {}

    /**
     * @brief Single left-to-right scan over sites sorted by (chr, pos).
     *
     * Sites must carry p-values (see SiteTable::fill_missing_pvalues).
     *
     * @return Non-overlapping spans in position order. Size-1 spans are kept.
     */
    std::vector<CandidateRegion> find(const std::vector<Site>& sites) const;

    /**
     * @brief Same scan over parallel arrays.
     */
    std::vector<CandidateRegion> find(const std::vector<double>& estimates, const std::vector<double>& p_values,
                                      const std::vector<std::string>& chrs, const std::vector<int64_t>& positions) const;

    const CandidateConfig& config() const { return config_; }

private:
    CandidateConfig config_;
};

}  // namespace DmrScan
