#ifndef COVARIANCE_HPP
#define COVARIANCE_HPP

#include <Eigen/Core>

namespace disk_fit {

/**
 * @brief Element-wise inverse that maps zeros to zero.
 *
 * Used to convert inverse variances to variances (and back) without
 * propagating infinities for masked or missing measurements.
 */
Eigen::ArrayXd
inverse(const Eigen::ArrayXd &a);

/// True if the symmetric matrix admits a Cholesky decomposition.
bool
is_positive_definite(const Eigen::MatrixXd &mat);

/**
 * @brief Project a symmetric matrix onto the nearest positive-definite matrix.
 *
 * Eigenvalues below @p min_eigenvalue are raised to it. If @p renormalize
 * is true, the result is rescaled so that its diagonal (the variances)
 * matches the input diagonal. A matrix that is already positive definite
 * is returned unchanged.
 *
 * @throws std::invalid_argument If the matrix is not square.
 */
Eigen::MatrixXd
impose_positive_definite(const Eigen::MatrixXd &mat, double min_eigenvalue = 1e-10, bool renormalize = true);

/**
 * @brief Inverse of a covariance matrix from its Cholesky decomposition.
 *
 * With @p upper true, returns U^-1, where mat = U^T U and U is upper
 * triangular. A residual row vector multiplied by U^-1 is whitened: its
 * squared norm equals r C^-1 r^T. With @p upper false, returns C^-1.
 *
 * @throws std::invalid_argument If the matrix is not square.
 * @throws std::runtime_error If the matrix is not positive definite.
 */
Eigen::MatrixXd
cinv(const Eigen::MatrixXd &mat, bool upper = false);

/**
 * @brief Parameter covariance matrix (J^T J)^-1 from a Jacobian.
 *
 * Computed with a singular-value decomposition.
 *
 * @throws std::runtime_error If the Jacobian is rank deficient (any singular
 * value below the numerical rank threshold), i.e. the precision matrix is
 * singular.
 */
Eigen::MatrixXd
cov_err(const Eigen::MatrixXd &jac);

} // namespace disk_fit

#endif // COVARIANCE_HPP
