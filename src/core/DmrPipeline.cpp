#include "core/DmrPipeline.hpp"

#include <omp.h>

#include <algorithm>
#include <exception>
#include <sstream>
#include <string>

#include "core/CrossDatasetCombiner.hpp"
#include "core/RegionShrinker.hpp"
#include "core/ResultCollator.hpp"
#include "core/SiteTable.hpp"
#include "utils/Logger.hpp"

namespace DmrScan {

PipelineOptions PipelineOptions::from_config(const Config& config) {
    PipelineOptions options;
    options.candidates.p_cutoff = config.p_cutoff;
    options.candidates.max_gap = config.max_gap;
    options.window = config.window;
    options.regularizer = config.regularizer;
    options.adjust_method = config.adjust_method;
    options.num_threads = config.threads;
    return options;
}

DmrPipeline::DmrPipeline(const PipelineOptions& options) : options_(options) {
    std::stringstream ss;
    ss << "DmrPipeline initialized:\n"
       << "  Threads: " << options_.num_threads << "\n"
       << "  p-value cutoff: " << options_.candidates.p_cutoff << "\n"
       << "  Max gap: " << options_.candidates.max_gap << "\n"
       << "  Correlation window: " << options_.window << " (regularizer " << options_.regularizer << ")\n"
       << "  Adjustment: " << adjust_method_to_string(options_.adjust_method);
    LOG_DEBUG(ss.str());
}

template <typename StatsFn>
std::vector<MetaStats> DmrPipeline::final_stats(const std::vector<ShrunkRegion>& shrunk,
                                                const StatsFn& stats_fn) const {
    const int n = static_cast<int>(shrunk.size());
    std::vector<MetaStats> stats(n);

    int threads = options_.num_threads > 0 ? options_.num_threads : omp_get_max_threads();
    std::exception_ptr first_error;

#pragma omp parallel for schedule(dynamic) num_threads(threads)
    for (int i = 0; i < n; ++i) {
        try {
            stats[i] = stats_fn(shrunk[i].start_idx, shrunk[i].end_idx);
        } catch (...) {
#pragma omp critical(final_stats_error)
            {
                if (!first_error) {
                    first_error = std::current_exception();
                }
            }
        }
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
    return stats;
}

PreparedDataset DmrPipeline::prepare(const std::vector<Site>& sites, const Eigen::MatrixXd& matrix) const {
    Utils::ScopedLogger scope("Prepare dataset (" + std::to_string(sites.size()) + " sites, " +
                              std::to_string(matrix.cols()) + " samples)", LogLevel::LOG_DEBUG);
    return PreparedDataset(sites, matrix, options_.window, options_.num_threads, options_.regularizer);
}

std::vector<DmrRecord> DmrPipeline::run_cohort(const std::vector<Site>& sites, const Eigen::MatrixXd& matrix) const {
    PreparedDataset dataset = prepare(sites, matrix);
    return run_cohort(dataset);
}

std::vector<DmrRecord> DmrPipeline::run_cohort(const PreparedDataset& dataset) const {
    Utils::ScopedLogger scope("Region calling (single dataset)");

    const auto& sites = dataset.sites();

    CandidateDetector detector(options_.candidates);
    auto candidates = detector.find(sites);
    LOG_INFO("[1] " + std::to_string(candidates.size()) + " candidate regions among " +
             std::to_string(sites.size()) + " sites");

    RegionShrinker shrinker(options_.num_threads);
    auto shrunk = shrinker.shrink(candidates, [&dataset](int start, int end) { return dataset.span_z(start, end); });
    LOG_INFO("[2] Shrinking used " + std::to_string(RegionShrinker::total_tests(shrunk)) + " evaluations");

    auto stats = final_stats(shrunk, [&dataset](int start, int end) { return dataset.span_stats(start, end); });

    ResultCollator collator(options_.adjust_method);
    return collator.collate(shrunk, stats, sites);
}

MetaAnalysisResult DmrPipeline::run_meta(const std::vector<PreparedDataset>& datasets) const {
    Utils::ScopedLogger scope("Region calling (" + std::to_string(datasets.size()) + " datasets)");

    CrossDatasetCombiner combiner(datasets);

    MetaAnalysisResult result;
    result.sites = combiner.combined_sites();

    std::vector<Site> sites = combiner.as_sites();

    CandidateDetector detector(options_.candidates);
    auto candidates = detector.find(sites);
    LOG_INFO("[1] " + std::to_string(candidates.size()) + " candidate regions among " +
             std::to_string(sites.size()) + " shared sites");

    RegionShrinker shrinker(options_.num_threads);
    auto shrunk =
        shrinker.shrink(candidates, [&combiner](int start, int end) { return combiner.region_z(start, end); });
    LOG_INFO("[2] Shrinking used " + std::to_string(RegionShrinker::total_tests(shrunk)) + " evaluations");

    auto stats =
        final_stats(shrunk, [&combiner](int start, int end) { return combiner.region_stats(start, end); });

    ResultCollator collator(options_.adjust_method);
    result.dmrs = collator.collate(shrunk, stats, sites);
    return result;
}

void DmrPipeline::print_summary(const std::vector<DmrRecord>& dmrs) const {
    int multi_site = 0;
    int significant = 0;
    double best_p = 1.0;
    for (const auto& dmr : dmrs) {
        if (dmr.n_sites > 1) multi_site++;
        if (dmr.p_adjust < 0.05) significant++;
        best_p = std::min(best_p, dmr.p_adjust);
    }

    std::stringstream ss;
    ss << "\n=== Region Summary ===\n"
       << "Regions: " << dmrs.size() << "\n"
       << "Regions with >1 site: " << multi_site << "\n"
       << "Regions with adjusted p < 0.05: " << significant << "\n";
    if (!dmrs.empty()) {
        ss << "Smallest adjusted p: " << best_p << "\n";
    }
    ss << "======================";
    LOG_INFO(ss.str());
}

}  // namespace DmrScan
