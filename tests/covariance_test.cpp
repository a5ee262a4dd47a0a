#include "covariance.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>

using namespace disk_fit;

TEST(CovarianceTest, InverseMapsZerosToZero) {
    Eigen::ArrayXd a(4);
    a << 2.0, 0.0, -4.0, 0.5;
    Eigen::ArrayXd const inv = inverse(a);
    EXPECT_DOUBLE_EQ(inv(0), 0.5);
    EXPECT_DOUBLE_EQ(inv(1), 0.0);
    EXPECT_DOUBLE_EQ(inv(2), -0.25);
    EXPECT_DOUBLE_EQ(inv(3), 2.0);
}

TEST(CovarianceTest, PositiveDefiniteCheck) {
    Eigen::Matrix2d pd;
    pd << 2.0, 0.5, 0.5, 1.0;
    Eigen::Matrix2d bad;
    bad << 1.0, 2.0, 2.0, 1.0;
    EXPECT_TRUE(is_positive_definite(pd));
    EXPECT_FALSE(is_positive_definite(bad));
    EXPECT_FALSE(is_positive_definite(Eigen::MatrixXd::Zero(2, 3)));
}

TEST(CovarianceTest, ImposePositiveDefinite) {
    Eigen::Matrix3d bad;
    bad << 1.0, 0.9, -0.9, 0.9, 1.0, 0.9, -0.9, 0.9, 1.0;
    ASSERT_FALSE(is_positive_definite(bad));
    Eigen::MatrixXd const fixed = impose_positive_definite(bad);
    EXPECT_TRUE(is_positive_definite(fixed));
    EXPECT_ARRAY_NEAR(fixed.diagonal(), bad.diagonal(), 1e-10, "variances");
    EXPECT_ARRAY_NEAR(fixed, fixed.transpose(), 0.0, "symmetry");

    // Already positive definite: unchanged
    Eigen::Matrix2d pd;
    pd << 2.0, 0.5, 0.5, 1.0;
    EXPECT_ARRAY_NEAR(impose_positive_definite(pd), pd, 0.0, "unchanged");
    EXPECT_THROW(impose_positive_definite(Eigen::MatrixXd::Zero(2, 3)), std::invalid_argument);
}

TEST(CovarianceTest, CholeskyInverse) {
    Eigen::Matrix3d c;
    c << 4.0, 1.0, 0.5, 1.0, 3.0, 0.2, 0.5, 0.2, 2.0;
    Eigen::MatrixXd const full = cinv(c);
    EXPECT_ARRAY_NEAR(full * c, Eigen::MatrixXd::Identity(3, 3), 1e-12, "C^-1 C");

    // C = U^T U, so U^-1 (U^-1)^T = C^-1
    Eigen::MatrixXd const uinv = cinv(c, true);
    EXPECT_ARRAY_NEAR(uinv * uinv.transpose(), full, 1e-12, "U^-1 U^-T");
    EXPECT_NEAR(uinv(1, 0), 0.0, 0.0);
    EXPECT_NEAR(uinv(2, 1), 0.0, 0.0);

    Eigen::Matrix2d bad;
    bad << 1.0, 2.0, 2.0, 1.0;
    EXPECT_THROW(cinv(bad), std::runtime_error);
}

TEST(CovarianceTest, ParameterCovarianceFromJacobian) {
    Eigen::MatrixXd jac(4, 2);
    jac << 1.0, 0.0, 1.0, 1.0, 1.0, 2.0, 1.0, 3.0;
    Eigen::MatrixXd const expected = (jac.transpose() * jac).inverse();
    EXPECT_ARRAY_NEAR(cov_err(jac), expected, 1e-12, "(J^T J)^-1");

    Eigen::MatrixXd degenerate(3, 2);
    degenerate << 1.0, 2.0, 2.0, 4.0, 3.0, 6.0;
    EXPECT_THROW(cov_err(degenerate), std::runtime_error);
    EXPECT_THROW(cov_err(Eigen::MatrixXd()), std::runtime_error);
}
