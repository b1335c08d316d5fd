#pragma once

#include <vector>

#include "DataStructs.hpp"
#include "PreparedDataset.hpp"

namespace DmrScan {

/**
 * @brief Combines independent datasets at site level and at region level.
 *
 * Site level: for ids present in every dataset, per-site estimates are
 * combined by inverse-variance weighting (datasets are independent).
 *
 * Region level: for a span of the combined table, each dataset computes its
 * own correlated (B, S) over the corresponding span of its sorted table,
 * using its own correlation band, and the per-dataset results are combined
 * again by inverse-variance weighting.
 *
 * The combiner keeps a reference to @p datasets, which must outlive it.
 */
class CrossDatasetCombiner {
public:
    /**
     * @throws std::invalid_argument if fewer than two datasets are given.
     */
    explicit CrossDatasetCombiner(const std::vector<PreparedDataset>& datasets);

    /// A temporary vector would leave the combiner dangling.
    explicit CrossDatasetCombiner(std::vector<PreparedDataset>&& datasets) = delete;

    /**
     * @brief Combined per-site table over the id intersection.
     *
     * Ordered as in the first dataset's sorted table; coordinates are taken
     * from the first dataset.
     */
    const std::vector<CombinedSite>& combined_sites() const { return sites_; }

    /**
     * @brief Combined table as Site records, for candidate detection.
     */
    std::vector<Site> as_sites() const;

    int size() const { return static_cast<int>(sites_.size()); }
    int num_datasets() const { return static_cast<int>(datasets_.size()); }

    /**
     * @brief Two-level (B, S) for the inclusive span [start, end] of the combined table.
     */
    MetaStats region_stats(int start, int end) const;

    /**
     * @brief z-score of region_stats().
     */
    double region_z(int start, int end) const;

private:
    const std::vector<PreparedDataset>& datasets_;
    std::vector<CombinedSite> sites_;
    std::vector<std::vector<int>> dataset_index_;  ///< [combined site][dataset] -> index in that dataset
};

}  // namespace DmrScan
