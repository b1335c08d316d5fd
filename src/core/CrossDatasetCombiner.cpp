#include "core/CrossDatasetCombiner.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "core/MetaAnalysis.hpp"
#include "utils/Logger.hpp"

namespace DmrScan {

CrossDatasetCombiner::CrossDatasetCombiner(const std::vector<PreparedDataset>& datasets) : datasets_(datasets) {
    if (datasets_.size() < 2) {
        throw std::invalid_argument("Cross-dataset meta-analysis requires at least two datasets, got " +
                                    std::to_string(datasets_.size()));
    }

    const int n_datasets = num_datasets();
    const auto& reference = datasets_.front().sites();

    Eigen::VectorXd estimates(n_datasets);
    Eigen::VectorXd se(n_datasets);

    for (const auto& site : reference) {
        std::vector<int> indices(n_datasets);
        bool in_all = true;
        for (int d = 0; d < n_datasets; ++d) {
            indices[d] = datasets_[d].find(site.id);
            if (indices[d] < 0) {
                in_all = false;
                break;
            }
        }
        if (!in_all) {
            continue;
        }

        for (int d = 0; d < n_datasets; ++d) {
            const Site& s = datasets_[d].sites()[indices[d]];
            estimates(d) = s.estimate;
            se(d) = s.se;
        }

        MetaResult result = to_result(inverse_variance_stats(estimates, se));

        CombinedSite combined;
        combined.id = site.id;
        combined.chr = site.chr;
        combined.pos = site.pos;
        combined.estimate = result.estimate;
        combined.se = result.se;
        combined.z = result.z;
        combined.p_value = result.p_value;

        sites_.push_back(combined);
        dataset_index_.push_back(std::move(indices));
    }

    if (sites_.empty()) {
        LOG_WARNING("Datasets share no site ids; meta-analysis results will be empty");
    } else {
        LOG_INFO("Combined " + std::to_string(sites_.size()) + " sites shared by " + std::to_string(n_datasets) +
                 " datasets");
    }
}

std::vector<Site> CrossDatasetCombiner::as_sites() const {
    std::vector<Site> sites;
    sites.reserve(sites_.size());
    for (const auto& c : sites_) {
        Site site;
        site.id = c.id;
        site.chr = c.chr;
        site.pos = c.pos;
        site.estimate = c.estimate;
        site.se = c.se;
        site.p_value = c.p_value;
        sites.push_back(site);
    }
    return sites;
}

MetaStats CrossDatasetCombiner::region_stats(int start, int end) const {
    const int n_datasets = num_datasets();

    Eigen::VectorXd estimates(n_datasets);
    Eigen::VectorXd se(n_datasets);

    for (int d = 0; d < n_datasets; ++d) {
        int ds_start = dataset_index_[start][d];
        int ds_end = dataset_index_[end][d];

        // A dataset whose coordinates disagree with the first can invert the span
        MetaStats stats = ds_end >= ds_start ? datasets_[d].span_stats(ds_start, ds_end) : MetaStats::null();
        estimates(d) = stats.B;
        se(d) = std::sqrt(stats.S);
    }

    return inverse_variance_stats(estimates, se);
}

double CrossDatasetCombiner::region_z(int start, int end) const {
    return region_stats(start, end).z();
}

}  // namespace DmrScan
