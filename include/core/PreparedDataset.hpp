#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include <Eigen/Dense>

#include "CorrelationBand.hpp"
#include "DataStructs.hpp"

namespace DmrScan {

/**
 * @brief One dataset ready for region analysis.
 *
 * Holds the site table sorted by (chr, pos) together with the banded
 * correlation of its measurements, both aligned row for row. Instances are
 * immutable once constructed, so they can be shared read-only across
 * worker threads.
 */
class PreparedDataset {
public:
    /**
     * @brief Sorts sites and matrix rows together and computes the correlation band.
     *
     * @param sites Site statistics in any order.
     * @param matrix Measurements, one row per entry of @p sites (same order), NaN = missing.
     * @param window Correlation bandwidth W.
     * @throws std::invalid_argument on row count mismatch or invalid sites.
     */
    PreparedDataset(const std::vector<Site>& sites, const Eigen::MatrixXd& matrix, int window, int num_threads = 1,
                    double regularizer = kDefaultRegularizer);

    /**
     * @brief Wraps sites with a precomputed band.
     *
     * The band is only meaningful for a fixed order, so the sites must
     * already be sorted by (chr, pos).
     *
     * @throws std::invalid_argument if sites are unsorted or the band row count differs.
     */
    PreparedDataset(const std::vector<Site>& sites, const CorrelationBand& band);

    const std::vector<Site>& sites() const { return sites_; }
    const CorrelationBand& band() const { return band_; }
    int size() const { return static_cast<int>(sites_.size()); }

    /**
     * @brief Index of a site id in the sorted table, or -1.
     */
    int find(const std::string& id) const;

    /**
     * @brief Correlated (B, S) for the inclusive span [start, end].
     *
     * Returns MetaStats::null() when the span is wider than the band.
     */
    MetaStats span_stats(int start, int end) const;

    /**
     * @brief z-score of span_stats(), 0 when the span is wider than the band.
     */
    double span_z(int start, int end) const;

private:
    std::vector<Site> sites_;
    CorrelationBand band_;
    std::unordered_map<std::string, int> index_;

    void finish_init();
};

}  // namespace DmrScan
