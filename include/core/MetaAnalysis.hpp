#pragma once

#include <vector>
#include <Eigen/Dense>

#include "DataStructs.hpp"

namespace DmrScan {

/**
 * @brief Two-sided p-value of a standard normal z-score, 2 * Phi(-|z|).
 */
double two_sided_pvalue(double z);

/**
 * @brief Expands (B, S) into estimate, se = sqrt(S), z and p-value.
 */
MetaResult to_result(const MetaStats& stats);

/**
 * @brief Standard inverse-variance weighted fixed-effect combination.
 *
 * Assumes the estimates are independent. Weights are 1/se^2.
 */
MetaStats inverse_variance_stats(const Eigen::VectorXd& estimates, const Eigen::VectorXd& se);

/**
 * @brief Generalized least squares fixed-effect combination of correlated estimates.
 *
 * Builds Sigma = D * rho * D with D = diag(se) and returns
 * B = (1' Sigma^-1 estimates) / (1' Sigma^-1 1) and S = 1 / (1' Sigma^-1 1).
 *
 * Returns MetaStats::null() when Sigma is not positive definite or rho
 * contains non-finite entries.
 *
 * @param estimates K estimates.
 * @param se K standard errors.
 * @param rho K x K correlation matrix.
 */
MetaStats correlated_stats(const Eigen::VectorXd& estimates, const Eigen::VectorXd& se, const Eigen::MatrixXd& rho);

/**
 * @brief z-score of correlated_stats() without building a MetaStats.
 *
 * Used in the shrinker's inner loop. Returns 0 where correlated_stats()
 * would return the null result.
 */
double correlated_z(const Eigen::VectorXd& estimates, const Eigen::VectorXd& se, const Eigen::MatrixXd& rho);

}  // namespace DmrScan
