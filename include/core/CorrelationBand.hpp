#pragma once

#include <vector>
#include <Eigen/Dense>

#include "DataStructs.hpp"

namespace DmrScan {

/// Default diagonal of a reconstructed correlation block.
constexpr double kDefaultRegularizer = 1.05;

/**
 * @brief Banded site-by-site correlation of a measurement matrix.
 *
 * For N sorted sites and window W, stores an N x W matrix where entry
 * (i, k-1) is the Pearson correlation between the measurements of site i
 * and site i+k. Entries past the last site or across a chromosome boundary
 * are NaN. The full N x N correlation is never built.
 *
 * Usage:
 * @code
 * CorrelationBand band = CorrelationBand::compute(meth, sites, 10);
 * Eigen::MatrixXd rho = band.block(start, end);
 * @endcode
 */
class CorrelationBand {
public:
    /// Row view of a column-major matrix without copying.
    using RowRef = Eigen::Ref<const Eigen::RowVectorXd, 0, Eigen::InnerStride<>>;

    CorrelationBand() = default;

    /**
     * @brief Wraps a precomputed N x W band.
     *
     * @param regularizer Diagonal value used by block().
     */
    explicit CorrelationBand(Eigen::MatrixXd band, double regularizer = kDefaultRegularizer);

    /**
     * @brief Computes the band from a measurement matrix.
     *
     * @param matrix Rows = sites (aligned to @p sites), columns = samples, NaN = missing.
     * @param sites Sites sorted by (chr, pos); used for chromosome boundaries.
     * @param window Bandwidth W (number of downstream neighbours per site).
     * @param num_threads OpenMP threads (<= 0 uses the OpenMP default).
     * @throws std::invalid_argument if row count differs from the site count or window < 1.
     */
    static CorrelationBand compute(const Eigen::MatrixXd& matrix, const std::vector<Site>& sites, int window,
                                   int num_threads = 1, double regularizer = kDefaultRegularizer);

    /**
     * @brief Pearson correlation over samples where both rows are finite.
     *
     * @return NaN when fewer than 3 complete pairs or either row has zero variance.
     */
    static double pairwise_pearson(const RowRef& x, const RowRef& y);

    int num_sites() const { return static_cast<int>(band_.rows()); }
    int window() const { return static_cast<int>(band_.cols()); }
    double regularizer() const { return regularizer_; }
    const Eigen::MatrixXd& values() const { return band_; }

    /**
     * @brief Largest span (in sites) for which block() is fully known.
     */
    int max_span() const { return window() + 1; }

    /**
     * @brief Correlation between site i and site i+offset (1 <= offset <= W).
     */
    double at(int i, int offset) const { return band_(i, offset - 1); }

    /**
     * @brief Dense correlation block for the inclusive span [start, end].
     *
     * Requires end - start + 1 <= max_span(). The diagonal holds the regularizer.
     */
    Eigen::MatrixXd block(int start, int end) const;

private:
    Eigen::MatrixXd band_;
    double regularizer_ = kDefaultRegularizer;
};

}  // namespace DmrScan
