#include "core/MetaAnalysis.hpp"

#include <cmath>
#include <stdexcept>

namespace DmrScan {

double two_sided_pvalue(double z) {
    // 2 * Phi(-|z|) = erfc(|z| / sqrt(2))
    return std::erfc(std::abs(z) / std::sqrt(2.0));
}

MetaResult to_result(const MetaStats& stats) {
    MetaResult result;
    result.estimate = stats.B;
    result.se = std::sqrt(stats.S);
    result.z = stats.B / result.se;
    result.p_value = two_sided_pvalue(result.z);
    return result;
}

MetaStats inverse_variance_stats(const Eigen::VectorXd& estimates, const Eigen::VectorXd& se) {
    if (estimates.size() != se.size() || estimates.size() == 0) {
        throw std::invalid_argument("inverse_variance_stats: estimates and se must be non-empty and equal length");
    }

    Eigen::VectorXd weights = se.array().square().inverse();
    double total = weights.sum();

    MetaStats stats;
    stats.B = weights.dot(estimates) / total;
    stats.S = 1.0 / total;
    return stats;
}

/**
 * @brief Solves Sigma x = 1 and returns (1' Sigma^-1 estimates, 1' Sigma^-1 1).
 *
 * @return false if Sigma is not positive definite or the result is unusable.
 */
static bool gls_sums(const Eigen::VectorXd& estimates, const Eigen::VectorXd& se, const Eigen::MatrixXd& rho,
                     double& weighted_sum, double& total_weight) {
    const Eigen::Index k = estimates.size();
    if (se.size() != k || rho.rows() != k || rho.cols() != k || k == 0) {
        throw std::invalid_argument("correlated_stats: estimates, se and rho dimensions disagree");
    }
    if (!rho.allFinite()) {
        return false;
    }

    Eigen::MatrixXd sigma = se.asDiagonal() * rho * se.asDiagonal();

    Eigen::LLT<Eigen::MatrixXd> llt(sigma);
    if (llt.info() != Eigen::Success) {
        return false;
    }

    Eigen::VectorXd w = llt.solve(Eigen::VectorXd::Ones(k));
    total_weight = w.sum();
    weighted_sum = w.dot(estimates);

    return std::isfinite(total_weight) && std::isfinite(weighted_sum) && total_weight > 0.0;
}

MetaStats correlated_stats(const Eigen::VectorXd& estimates, const Eigen::VectorXd& se, const Eigen::MatrixXd& rho) {
    double weighted_sum = 0.0;
    double total_weight = 0.0;
    if (!gls_sums(estimates, se, rho, weighted_sum, total_weight)) {
        return MetaStats::null();
    }

    MetaStats stats;
    stats.B = weighted_sum / total_weight;
    stats.S = 1.0 / total_weight;
    return stats;
}

double correlated_z(const Eigen::VectorXd& estimates, const Eigen::VectorXd& se, const Eigen::MatrixXd& rho) {
    double weighted_sum = 0.0;
    double total_weight = 0.0;
    if (!gls_sums(estimates, se, rho, weighted_sum, total_weight)) {
        return 0.0;
    }
    // B / sqrt(S) = (sum / total) * sqrt(total)
    return weighted_sum / std::sqrt(total_weight);
}

}  // namespace DmrScan
