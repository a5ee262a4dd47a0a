#include "covariance.hpp"
#include <Eigen/Cholesky>   // For LLT
#include <Eigen/Eigenvalues> // For SelfAdjointEigenSolver
#include <Eigen/SVD>         // For JacobiSVD in cov_err
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace disk_fit {

Eigen::ArrayXd
inverse(const Eigen::ArrayXd &a) {
    return (a == 0.0).select(Eigen::ArrayXd::Zero(a.size()), a.inverse());
}

bool
is_positive_definite(const Eigen::MatrixXd &mat) {
    if (mat.rows() != mat.cols() || mat.rows() == 0) { return false; }
    Eigen::LLT<Eigen::MatrixXd> const llt(mat);
    return llt.info() == Eigen::Success;
}

Eigen::MatrixXd
impose_positive_definite(const Eigen::MatrixXd &mat, double min_eigenvalue, bool renormalize) {
    if (mat.rows() != mat.cols()) { throw std::invalid_argument("Covariance matrix must be square."); }
    if (is_positive_definite(mat)) { return mat; }

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> const eig(mat);
    if (eig.info() != Eigen::Success) {
        throw std::runtime_error("Eigen-decomposition of the covariance matrix failed.");
    }
    Eigen::VectorXd const w = eig.eigenvalues().cwiseMax(min_eigenvalue);
    Eigen::MatrixXd const &v = eig.eigenvectors();
    Eigen::MatrixXd pd = v * w.asDiagonal() * v.transpose();
    if (renormalize) {
        Eigen::ArrayXd const scale = (mat.diagonal().array() / pd.diagonal().array()).max(0.0).sqrt();
        pd = scale.matrix().asDiagonal() * pd * scale.matrix().asDiagonal();
    }
    // Restore exact symmetry lost to round-off
    return 0.5 * (pd + pd.transpose());
}

Eigen::MatrixXd
cinv(const Eigen::MatrixXd &mat, bool upper) {
    if (mat.rows() != mat.cols()) { throw std::invalid_argument("Matrix to invert must be square."); }
    Eigen::LLT<Eigen::MatrixXd> const llt(mat);
    if (llt.info() != Eigen::Success) {
        throw std::runtime_error("Cholesky decomposition failed; matrix is not positive definite.");
    }
    Eigen::Index const n = mat.rows();
    if (!upper) { return llt.solve(Eigen::MatrixXd::Identity(n, n)); }
    Eigen::MatrixXd const u = llt.matrixU();
    return u.triangularView<Eigen::Upper>().solve(Eigen::MatrixXd::Identity(n, n));
}

Eigen::MatrixXd
cov_err(const Eigen::MatrixXd &jac) {
    if (jac.size() == 0) { throw std::runtime_error("Cannot compute covariance from an empty Jacobian."); }
    Eigen::JacobiSVD<Eigen::MatrixXd> const svd(jac, Eigen::ComputeThinV);
    Eigen::VectorXd const &s = svd.singularValues();
    double const threshold =
      std::numeric_limits<double>::epsilon() * static_cast<double>(std::max(jac.rows(), jac.cols())) * s(0);
    if (s.size() < jac.cols() || (s.array() <= threshold).any()) {
        throw std::runtime_error("Jacobian is rank deficient; precision matrix is singular (rank " +
                                 std::to_string((s.array() > threshold).count()) + " of " +
                                 std::to_string(jac.cols()) + ").");
    }
    Eigen::MatrixXd const &v = svd.matrixV();
    return v * s.array().square().inverse().matrix().asDiagonal() * v.transpose();
}

} // namespace disk_fit
