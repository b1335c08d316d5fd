#include "core/CorrelationBand.hpp"

#include <omp.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "utils/Logger.hpp"

namespace DmrScan {

CorrelationBand::CorrelationBand(Eigen::MatrixXd band, double regularizer)
    : band_(std::move(band)), regularizer_(regularizer) {
}

double CorrelationBand::pairwise_pearson(const RowRef& x, const RowRef& y) {
    const int n = static_cast<int>(x.size());

    int count = 0;
    double sum_x = 0.0;
    double sum_y = 0.0;
    for (int k = 0; k < n; ++k) {
        if (std::isfinite(x(k)) && std::isfinite(y(k))) {
            sum_x += x(k);
            sum_y += y(k);
            count++;
        }
    }

    if (count < 3) {
        return NAN;
    }

    double mean_x = sum_x / count;
    double mean_y = sum_y / count;

    double sum_prod = 0.0;
    double sum_sq_x = 0.0;
    double sum_sq_y = 0.0;
    double raw_sq_x = 0.0;
    double raw_sq_y = 0.0;
    for (int k = 0; k < n; ++k) {
        if (std::isfinite(x(k)) && std::isfinite(y(k))) {
            double dx = x(k) - mean_x;
            double dy = y(k) - mean_y;
            sum_prod += dx * dy;
            sum_sq_x += dx * dx;
            sum_sq_y += dy * dy;
            raw_sq_x += x(k) * x(k);
            raw_sq_y += y(k) * y(k);
        }
    }

    // Zero variance, measured relative to the magnitude of the values
    if (sum_sq_x <= 1e-12 * raw_sq_x || sum_sq_y <= 1e-12 * raw_sq_y) {
        return NAN;
    }

    double corr = sum_prod / (std::sqrt(sum_sq_x) * std::sqrt(sum_sq_y));

    // Clamp to [-1, 1] due to floating point errors
    return std::max(-1.0, std::min(1.0, corr));
}

CorrelationBand CorrelationBand::compute(const Eigen::MatrixXd& matrix, const std::vector<Site>& sites, int window,
                                         int num_threads, double regularizer) {
    const int n = static_cast<int>(sites.size());

    if (matrix.rows() != n) {
        throw std::invalid_argument("Dimension mismatch: measurement matrix has " + std::to_string(matrix.rows()) +
                                    " rows but site table has " + std::to_string(n) + " sites");
    }
    if (window < 1) {
        throw std::invalid_argument("Correlation window must be at least 1");
    }

    Eigen::MatrixXd band = Eigen::MatrixXd::Constant(n, window, NAN);

    int threads = num_threads > 0 ? num_threads : omp_get_max_threads();

#pragma omp parallel for schedule(dynamic, 256) num_threads(threads)
    for (int i = 0; i < n; ++i) {
        for (int offset = 1; offset <= window && i + offset < n; ++offset) {
            int j = i + offset;
            if (sites[j].chr != sites[i].chr) {
                break;
            }
            band(i, offset - 1) = pairwise_pearson(matrix.row(i), matrix.row(j));
        }
    }

    LOG_DEBUG("Computed correlation band: " + std::to_string(n) + " sites x " + std::to_string(window) +
              " offsets over " + std::to_string(matrix.cols()) + " samples");

    return CorrelationBand(std::move(band), regularizer);
}

Eigen::MatrixXd CorrelationBand::block(int start, int end) const {
    const int k = end - start + 1;
    if (start < 0 || end >= num_sites() || k < 1 || k > max_span()) {
        throw std::out_of_range("Correlation block [" + std::to_string(start) + ", " + std::to_string(end) +
                                "] is outside the band");
    }

    Eigen::MatrixXd rho = Eigen::MatrixXd::Identity(k, k) * regularizer_;
    for (int i = 0; i < k - 1; ++i) {
        for (int j = i + 1; j < k; ++j) {
            double r = band_(start + i, j - i - 1);
            rho(i, j) = r;
            rho(j, i) = r;
        }
    }
    return rho;
}

}  // namespace DmrScan
