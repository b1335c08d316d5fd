#include "core/PreparedDataset.hpp"

#include <stdexcept>
#include <string>

#include "core/MetaAnalysis.hpp"
#include "core/SiteTable.hpp"

namespace DmrScan {

PreparedDataset::PreparedDataset(const std::vector<Site>& sites, const Eigen::MatrixXd& matrix, int window,
                                 int num_threads, double regularizer) {
    if (matrix.rows() != static_cast<Eigen::Index>(sites.size())) {
        throw std::invalid_argument("Dimension mismatch: measurement matrix has " + std::to_string(matrix.rows()) +
                                    " rows but site table has " + std::to_string(sites.size()) + " sites");
    }
    SiteTable::validate(sites);

    std::vector<int> order = SiteTable::sort_order(sites);
    sites_ = SiteTable::permute(sites, order);

    Eigen::MatrixXd sorted_matrix(matrix.rows(), matrix.cols());
    for (size_t k = 0; k < order.size(); ++k) {
        sorted_matrix.row(static_cast<Eigen::Index>(k)) = matrix.row(order[k]);
    }

    band_ = CorrelationBand::compute(sorted_matrix, sites_, window, num_threads, regularizer);
    finish_init();
}

PreparedDataset::PreparedDataset(const std::vector<Site>& sites, const CorrelationBand& band)
    : sites_(sites), band_(band) {
    if (band_.num_sites() != static_cast<int>(sites_.size())) {
        throw std::invalid_argument("Dimension mismatch: correlation band has " + std::to_string(band_.num_sites()) +
                                    " rows but site table has " + std::to_string(sites_.size()) + " sites");
    }
    SiteTable::validate(sites_);
    if (!SiteTable::is_sorted(sites_)) {
        throw std::invalid_argument("Sites paired with a precomputed correlation band must be sorted by position");
    }
    finish_init();
}

void PreparedDataset::finish_init() {
    SiteTable::fill_missing_pvalues(sites_);

    index_.reserve(sites_.size());
    for (size_t i = 0; i < sites_.size(); ++i) {
        index_.emplace(sites_[i].id, static_cast<int>(i));
    }
}

int PreparedDataset::find(const std::string& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? -1 : it->second;
}

MetaStats PreparedDataset::span_stats(int start, int end) const {
    const int k = end - start + 1;
    if (k > band_.max_span()) {
        return MetaStats::null();
    }

    Eigen::VectorXd estimates(k);
    Eigen::VectorXd se(k);
    for (int i = 0; i < k; ++i) {
        estimates(i) = sites_[start + i].estimate;
        se(i) = sites_[start + i].se;
    }

    return correlated_stats(estimates, se, band_.block(start, end));
}

double PreparedDataset::span_z(int start, int end) const {
    const int k = end - start + 1;
    if (k > band_.max_span()) {
        return 0.0;
    }

    Eigen::VectorXd estimates(k);
    Eigen::VectorXd se(k);
    for (int i = 0; i < k; ++i) {
        estimates(i) = sites_[start + i].estimate;
        se(i) = sites_[start + i].se;
    }
    return correlated_z(estimates, se, band_.block(start, end));
}

}  // namespace DmrScan
