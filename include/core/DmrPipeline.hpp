#pragma once

#include <vector>
#include <Eigen/Dense>

#include "core/CandidateDetector.hpp"
#include "core/Config.hpp"
#include "core/CorrelationBand.hpp"
#include "core/DataStructs.hpp"
#include "core/PreparedDataset.hpp"
#include "core/Types.hpp"

namespace DmrScan {

/**
 * @brief Parameters consumed by the region pipeline.
 */
struct PipelineOptions {
    CandidateConfig candidates;                             ///< p-value cutoff and max gap
    int window = 20;                                        ///< Correlation bandwidth W
    double regularizer = kDefaultRegularizer;               ///< Diagonal of correlation blocks
    AdjustMethod adjust_method = AdjustMethod::BONFERRONI;  ///< Multiplicity correction
    int num_threads = 1;                                    ///< OpenMP threads (<= 0 = OpenMP default)

    static PipelineOptions from_config(const Config& config);
};

/**
 * @brief Output of the multi-dataset entry point.
 */
struct MetaAnalysisResult {
    std::vector<CombinedSite> sites;  ///< Per-site meta-analysis over the id intersection
    std::vector<DmrRecord> dmrs;      ///< Regions called on the combined table
};

/**
 * @brief Entry points for region discovery.
 *
 * Stages: candidate detection -> shrinking (scored by the correlated
 * meta-analysis engine) -> final statistics -> collation with a global
 * multiplicity correction. Shrinking and final statistics run in parallel
 * over candidates; all inputs are read-only for the whole run.
 *
 * Usage:
 * @code
 * DmrPipeline pipeline(PipelineOptions::from_config(config));
 * auto dmrs = pipeline.run_cohort(sites, matrix);
 * @endcode
 */
class DmrPipeline {
public:
    explicit DmrPipeline(const PipelineOptions& options = PipelineOptions());

    /**
     * @brief Sorts one dataset and computes its correlation band.
     */
    PreparedDataset prepare(const std::vector<Site>& sites, const Eigen::MatrixXd& matrix) const;

    /**
     * @brief Single-dataset region calling.
     *
     * @return One record per candidate, in candidate discovery order.
     */
    std::vector<DmrRecord> run_cohort(const PreparedDataset& dataset) const;

    /**
     * @brief Convenience overload: prepare() then run_cohort().
     *
     * @throws std::invalid_argument if matrix rows != number of sites.
     */
    std::vector<DmrRecord> run_cohort(const std::vector<Site>& sites, const Eigen::MatrixXd& matrix) const;

    /**
     * @brief Multi-dataset region calling.
     *
     * @throws std::invalid_argument with fewer than two datasets.
     */
    MetaAnalysisResult run_meta(const std::vector<PreparedDataset>& datasets) const;

    /**
     * @brief Logs a short summary of the called regions.
     */
    void print_summary(const std::vector<DmrRecord>& dmrs) const;

    const PipelineOptions& options() const { return options_; }

private:
    PipelineOptions options_;

    /**
     * @brief Evaluates @p stats_fn for every shrunk span in parallel.
     */
    template <typename StatsFn>
    std::vector<MetaStats> final_stats(const std::vector<ShrunkRegion>& shrunk, const StatsFn& stats_fn) const;
};

}  // namespace DmrScan
