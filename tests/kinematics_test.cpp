#include "beam.hpp"
#include "kinematics.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <vector>

using namespace disk_fit;

namespace {

// 4x4 map with three full bins, one single-pixel bin and four unbinned pixels
IntMap
example_binid() {
    IntMap binid(4, 4);
    binid << 0, 0, 1, 1,   //
      0, 0, 1, 1,          //
      2, 2, -1, -1,        //
      2, -1, -1, 3;
    return binid;
}

KinematicsInput
binned_input() {
    KinematicsInput input;
    input.vel = index_map(4);
    input.binid = example_binid();
    input.grid_x = random_map(4, -2.0, 2.0, 11);
    input.grid_y = random_map(4, -2.0, 2.0, 12);
    return input;
}

} // namespace

class KinematicsBinnedTest : public ::testing::Test {
  protected:
    KinematicsBinnedTest()
      : kin(binned_input()) {}

    Kinematics kin;
};

TEST(KinematicsTest, ZeroFieldRemapsUnmasked) {
    KinematicsInput input;
    input.vel = Map2D(Map2D::Zero(10, 10));
    Kinematics const kin(input);
    EXPECT_EQ(kin.nmeas(), 100);
    EXPECT_EQ(kin.spatial_shape(), 10);

    std::optional<MaskedMap> const vel = kin.remap("vel");
    ASSERT_TRUE(vel.has_value());
    EXPECT_TRUE((vel->data == 0.0).all());
    EXPECT_FALSE(vel->mask.any());
}

TEST(KinematicsTest, DefaultCoordinateGrid) {
    KinematicsInput input;
    input.vel = Map2D(Map2D::Zero(4, 4));
    Kinematics const kin(input);
    // Flattened in row-major order: x decreases along a row, y increases down the rows
    EXPECT_DOUBLE_EQ(kin.x()(0), 1.0);
    EXPECT_DOUBLE_EQ(kin.x()(3), -2.0);
    EXPECT_DOUBLE_EQ(kin.y()(0), -2.0);
    EXPECT_DOUBLE_EQ(kin.y()(15), 1.0);
    EXPECT_ARRAY_NEAR(ravel(kin.grid_x()), kin.x(), 0.0, "grid_x");
    EXPECT_FALSE(kin.binid().has_value());
}

TEST(KinematicsTest, RejectsInvalidInput) {
    KinematicsInput non_square;
    non_square.vel = Map2D(Map2D::Zero(3, 4));
    EXPECT_THROW((Kinematics(non_square)), std::invalid_argument);

    KinematicsInput mismatched;
    mismatched.vel = Map2D(Map2D::Zero(4, 4));
    mismatched.vel_ivar = Map2D(Map2D::Ones(3, 3));
    EXPECT_THROW((Kinematics(mismatched)), std::invalid_argument);

    KinematicsInput only_x;
    only_x.vel = Map2D(Map2D::Zero(4, 4));
    only_x.x = Map2D::Zero(4, 4);
    EXPECT_THROW((Kinematics(only_x)), std::invalid_argument);

    KinematicsInput no_grid;
    no_grid.vel = Map2D(Map2D::Zero(4, 4));
    no_grid.binid = example_binid();
    no_grid.grid_x = Map2D::Zero(4, 4);
    EXPECT_THROW((Kinematics(no_grid)), std::invalid_argument);

    KinematicsInput bad_id = binned_input();
    (*bad_id.binid)(0, 0) = -2;
    EXPECT_THROW((Kinematics(bad_id)), std::invalid_argument);

    KinematicsInput bad_covar;
    bad_covar.vel = Map2D(Map2D::Zero(4, 4));
    bad_covar.vel_covar = PixelCovariance(4, 4);
    EXPECT_THROW((Kinematics(bad_covar)), std::invalid_argument);
}

TEST(KinematicsTest, NonPositiveIvarIsMasked) {
    KinematicsInput input;
    input.vel = random_map(5, -100.0, 100.0);
    Map2D ivar = Map2D::Ones(5, 5);
    ivar(1, 2) = 0.0;
    ivar(3, 4) = -1.0;
    input.vel_ivar = ivar;
    Map2D sig_ivar = Map2D::Ones(5, 5);
    sig_ivar(0, 0) = 0.0;
    input.sig = Map2D(Map2D::Constant(5, 5, 30.0));
    input.sig_ivar = sig_ivar;
    Kinematics const kin(input);

    EXPECT_EQ(kin.vel_mask().count(), 2);
    EXPECT_TRUE(kin.vel_mask()(1 * 5 + 2));
    EXPECT_TRUE(kin.vel_mask()(3 * 5 + 4));
    ASSERT_TRUE(kin.sig_mask().has_value());
    EXPECT_EQ(kin.sig_mask()->count(), 1);
    EXPECT_TRUE((*kin.sig_mask())(0));

    // Errors are zero where the inverse variance is zero
    ASSERT_TRUE(kin.vel_err().has_value());
    EXPECT_DOUBLE_EQ((*kin.vel_err())(7), 0.0);
    EXPECT_DOUBLE_EQ((*kin.vel_err())(0), 1.0);
}

TEST(KinematicsTest, InputMasksAreCombined) {
    KinematicsInput input;
    BoolMap data_mask = BoolMap::Constant(3, 3, false);
    data_mask(0, 1) = true;
    BoolMap extra_mask = BoolMap::Constant(3, 3, false);
    extra_mask(2, 2) = true;
    input.vel = MaskedMap(Map2D::Ones(3, 3), data_mask);
    input.vel_mask = extra_mask;
    Kinematics const kin(input);
    EXPECT_EQ(kin.vel_mask().count(), 2);

    std::optional<MaskedMap> const vel = kin.remap("vel");
    ASSERT_TRUE(vel.has_value());
    EXPECT_TRUE(vel->mask(0, 1));
    EXPECT_TRUE(vel->mask(2, 2));
    EXPECT_FALSE(vel->mask(1, 1));
}

TEST_F(KinematicsBinnedTest, UniqueMeasurementsExcludeUnbinnedPixels) {
    EXPECT_EQ(kin.nmeas(), 4);
    ASSERT_TRUE(kin.binid().has_value());
    Eigen::ArrayXi expected_ids(4);
    expected_ids << 0, 1, 2, 3;
    EXPECT_TRUE((*kin.binid() == expected_ids).all());

    // Each bin is represented by its first pixel
    Eigen::ArrayXd expected_vel(4);
    expected_vel << 0.0, 2.0, 8.0, 15.0;
    EXPECT_ARRAY_NEAR(kin.vel(), expected_vel, 0.0, "vel");

    EXPECT_EQ(kin.grid_indx().size(), 12);
    for (Eigen::Index k = 0; k < kin.grid_indx().size(); ++k) {
        Eigen::Index const g = kin.grid_indx()(k);
        EXPECT_NE(example_binid()(g / 4, g % 4), -1);
    }

    // Unbinned pixels have no weight in the bin operator
    Eigen::MatrixXd const dense = Eigen::MatrixXd(kin.bin_transform());
    for (Eigen::Index g : { 10, 11, 13, 14 }) { EXPECT_EQ(dense.col(g).sum(), 0.0); }
}

TEST_F(KinematicsBinnedTest, BinTransformRowsSumToOne) {
    Eigen::MatrixXd const dense = Eigen::MatrixXd(kin.bin_transform());
    ASSERT_EQ(dense.rows(), 4);
    ASSERT_EQ(dense.cols(), 16);
    for (Eigen::Index i = 0; i < dense.rows(); ++i) { EXPECT_NEAR(dense.row(i).sum(), 1.0, 1e-14); }
}

TEST_F(KinematicsBinnedTest, BinThenRemapGivesBinMeans) {
    Eigen::ArrayXd const binned = kin.bin(index_map(4));
    EXPECT_NEAR(binned(0), 2.5, 1e-12);
    EXPECT_NEAR(binned(1), 4.5, 1e-12);
    EXPECT_NEAR(binned(2), 29.0 / 3.0, 1e-12);
    EXPECT_NEAR(binned(3), 15.0, 1e-12);

    MaskedMap const remapped = kin.remap(binned);
    EXPECT_NEAR(remapped.data(0, 0), 2.5, 1e-12);
    EXPECT_NEAR(remapped.data(1, 1), 2.5, 1e-12);
    EXPECT_NEAR(remapped.data(3, 0), 29.0 / 3.0, 1e-12);
    EXPECT_TRUE(remapped.mask(2, 2));
    EXPECT_TRUE(remapped.mask(3, 2));
    EXPECT_FALSE(remapped.mask(3, 3));

    MaskedMap const unmasked = kin.remap(binned, false);
    EXPECT_FALSE(unmasked.mask.any());
    EXPECT_EQ(unmasked.data(2, 2), 0.0);

    EXPECT_THROW(kin.bin(Map2D::Zero(3, 3)), std::invalid_argument);
    EXPECT_THROW(kin.remap(Eigen::ArrayXd::Zero(5)), std::invalid_argument);
}

TEST(KinematicsTest, UnbinnedRemapRoundTrip) {
    KinematicsInput input;
    input.vel = random_map(6, -200.0, 200.0);
    input.sb = random_map(6, 0.1, 1.0, 5);
    Kinematics const kin(input);
    EXPECT_ARRAY_NEAR(kin.bin(kin.remap("vel")->data), kin.vel(), 0.0, "vel");
    EXPECT_ARRAY_NEAR(kin.bin(kin.remap("sb")->data), *kin.sb(), 0.0, "sb");
    EXPECT_ARRAY_NEAR(kin.remap(kin.vel()).data, input.vel.data, 0.0, "remap");
}

TEST(KinematicsTest, RemapAttributeLookup) {
    KinematicsInput input;
    input.vel = Map2D(Map2D::Ones(3, 3));
    Kinematics const kin(input);
    EXPECT_FALSE(kin.remap("sig").has_value());
    EXPECT_FALSE(kin.remap("vel_ivar").has_value());
    EXPECT_TRUE(kin.remap("x").has_value());
    try {
        (void)kin.remap("not_an_attribute");
        FAIL() << "Expected std::out_of_range";
    } catch (const std::out_of_range &e) {
        EXPECT_STREQ(e.what(), "No attribute called not_an_attribute.");
    }
}

TEST(KinematicsTest, MaxRadiusBoundsAllMeasurements) {
    KinematicsInput input;
    input.vel = Map2D(Map2D::Zero(7, 7));
    input.x = random_map(7, -5.0, 3.0, 21);
    input.y = random_map(7, -1.0, 6.0, 22);
    Kinematics const kin(input);
    double const rmax = kin.max_radius();
    Eigen::ArrayXd const r = (kin.x().square() + kin.y().square()).sqrt();
    EXPECT_TRUE((r <= rmax + 1e-12).all());
}

TEST(KinematicsTest, DispersionDerivedQuantities) {
    KinematicsInput input;
    input.vel = Map2D(Map2D::Zero(3, 3));
    Map2D sig = Map2D::Constant(3, 3, 50.0);
    sig(0, 0) = 0.0;
    input.sig = sig;
    input.sig_ivar = Map2D(Map2D::Constant(3, 3, 0.04));
    input.sig_corr = Map2D(Map2D::Constant(3, 3, 10.0));
    Kinematics const kin(input);

    ASSERT_TRUE(kin.sig_phys2().has_value());
    EXPECT_DOUBLE_EQ((*kin.sig_phys2())(1), 2500.0 - 100.0);
    ASSERT_TRUE(kin.sig_err().has_value());
    EXPECT_DOUBLE_EQ((*kin.sig_err())(1), 5.0);
    ASSERT_TRUE(kin.sig_phys2_ivar().has_value());
    // Error of sig^2 is 2 sig err(sig)
    EXPECT_NEAR((*kin.sig_phys2_ivar())(1), 1.0 / std::pow(2.0 * 50.0 * 5.0, 2), 1e-15);
    EXPECT_TRUE(std::isfinite((*kin.sig_phys2_ivar())(0)));
}

TEST(KinematicsTest, CovarianceIsSubsetToMeasurements) {
    KinematicsInput input = binned_input();
    std::vector<Eigen::Triplet<double>> triplets;
    for (int i = 0; i < 16; ++i) { triplets.emplace_back(i, i, static_cast<double>(i + 1)); }
    triplets.emplace_back(0, 2, 0.5);
    triplets.emplace_back(2, 0, 0.5);
    PixelCovariance covar(16, 16);
    covar.setFromTriplets(triplets.begin(), triplets.end());
    input.vel_covar = covar;
    input.sig = Map2D(Map2D::Constant(4, 4, 2.0));
    input.sig_covar = covar;
    Kinematics const with_covar(input);

    ASSERT_TRUE(with_covar.vel_covar().has_value());
    Eigen::MatrixXd expected = Eigen::MatrixXd::Zero(4, 4);
    expected.diagonal() << 1.0, 3.0, 9.0, 16.0;
    expected(0, 1) = 0.5;
    expected(1, 0) = 0.5;
    EXPECT_ARRAY_NEAR(*with_covar.vel_covar(), expected, 0.0, "vel_covar");

    // Propagated to sigma^2: J C J with J = 2 sig = 4
    ASSERT_TRUE(with_covar.sig_phys2_covar().has_value());
    EXPECT_ARRAY_NEAR(*with_covar.sig_phys2_covar(), 16.0 * expected, 1e-12, "sig_phys2_covar");
}

TEST(KinematicsTest, BeamFromPsf) {
    KinematicsInput input;
    input.vel = Map2D(Map2D::Zero(8, 8));
    input.psf = gauss2d_kernel(8, 2.0);
    Kinematics const kin(input);
    ASSERT_TRUE(kin.beam().has_value());
    ASSERT_TRUE(kin.beam_fft().has_value());
    EXPECT_NEAR((*kin.beam_fft())(0, 0).real(), 1.0, 1e-12);
}

TEST(KinematicsTest, SetEdgesAndFitArgs) {
    KinematicsInput input;
    input.vel = Map2D(Map2D::Zero(5, 5));
    Kinematics kin(input);
    kin.setedges(2.0, 10.0);
    Eigen::ArrayXd expected(6);
    expected << 0.0, 2.0, 4.0, 6.0, 8.0, 10.0;
    EXPECT_ARRAY_NEAR(kin.fitargs().edges, expected, 1e-12, "width");

    kin.setedges(4, 10.0, true);
    Eigen::ArrayXd expected_n(5);
    expected_n << 0.0, 2.5, 5.0, 7.5, 10.0;
    EXPECT_ARRAY_NEAR(kin.fitargs().edges, expected_n, 1e-12, "count");

    kin.setedges(1.0);
    EXPECT_GE(kin.fitargs().edges(kin.fitargs().edges.size() - 1), kin.max_radius());
    EXPECT_THROW(kin.setedges(0.0), std::invalid_argument);

    kin.setfixcent(true);
    kin.setdisp(true);
    EXPECT_TRUE(kin.fitargs().fixcent);
    EXPECT_TRUE(kin.fitargs().disp);
}

TEST(KinematicsTest, BorderRequiresMask) {
    KinematicsInput input;
    input.vel = Map2D(Map2D::Zero(3, 3));
    Kinematics kin(input);
    EXPECT_THROW(kin.border(), std::runtime_error);
}

TEST(KinematicsMockTest, FaceOnFieldIsSystemic) {
    MockGalaxy galaxy;
    galaxy.inc = 0.0;
    galaxy.vsys = 25.0;
    galaxy.vt = Eigen::ArrayXd::Zero(2);
    galaxy.v2t = Eigen::ArrayXd::Zero(2);
    galaxy.v2r = Eigen::ArrayXd::Zero(2);
    galaxy.sig = Eigen::ArrayXd::Zero(2);
    Kinematics const kin = Kinematics::mock(galaxy);
    EXPECT_TRUE((kin.vel() - 25.0).abs().maxCoeff() < 1e-12);
}

TEST(KinematicsMockTest, BorderPaddingAndMask) {
    MockGalaxy galaxy = tanh_mock(200.0, 3.0, 20);
    galaxy.size = 20;
    Kinematics kin = Kinematics::mock(galaxy);

    Eigen::Index const n = kin.spatial_shape();
    EXPECT_GT(n, galaxy.size);
    EXPECT_EQ((n - galaxy.size) % 2, 0);
    ASSERT_TRUE(kin.bordermask().has_value());
    EXPECT_EQ(kin.bordermask()->size() - kin.bordermask()->count(), galaxy.size * galaxy.size);
    ASSERT_TRUE(kin.beam_fft().has_value());
    ASSERT_TRUE(kin.sb().has_value());
    ASSERT_TRUE(kin.sig().has_value());

    EXPECT_FALSE(kin.vel_mask().any());
    kin.border();
    EXPECT_TRUE((kin.vel_mask() == *kin.bordermask()).all());
    EXPECT_TRUE((*kin.sig_mask() == *kin.bordermask()).all());
}

TEST(KinematicsMockTest, RecedingSideIsPositive) {
    MockGalaxy galaxy = tanh_mock(200.0, 3.0, 50);
    galaxy.border = 0.0;
    galaxy.size = 31;
    galaxy.pa = 90.0;
    galaxy.inc = 60.0;
    Kinematics const kin = Kinematics::mock(galaxy);
    // pa = 90 puts the receding major axis along +x
    for (Eigen::Index k = 0; k < kin.nmeas(); ++k) {
        if (std::abs(kin.y()(k)) < 1e-10 && kin.x()(k) > 1.0) { EXPECT_GT(kin.vel()(k), 0.0); }
        if (std::abs(kin.y()(k)) < 1e-10 && kin.x()(k) < -1.0) { EXPECT_LT(kin.vel()(k), 0.0); }
    }
    EXPECT_THROW(Kinematics::mock(MockGalaxy()), std::invalid_argument);
}
