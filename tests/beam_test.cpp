#include "beam.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>
#include <cmath>

using namespace disk_fit;

TEST(BeamTest, ShiftsAreInverse) {
    Map2D const map = index_map(7);
    EXPECT_ARRAY_NEAR(fftshift(ifftshift(map)), map, 0.0, "odd size");
    Map2D const even = index_map(6);
    EXPECT_ARRAY_NEAR(fftshift(ifftshift(even)), even, 0.0, "even size");
    // The center pixel moves to the origin
    EXPECT_EQ(ifftshift(even)(0, 0), even(3, 3));
}

TEST(BeamTest, FftRoundTrip) {
    ConvolveFFT cnv;
    Map2D const map = random_map(8, -1.0, 1.0);
    ComplexMap2D const back = cnv.ifft(cnv.fft(map));
    EXPECT_ARRAY_NEAR(Map2D(back.real()), map, 1e-12, "ifft(fft(x))");
    EXPECT_NEAR(cnv.fft(map)(0, 0).real(), map.sum(), 1e-10);
}

TEST(BeamTest, GaussianKernelIsNormalizedAndCentered) {
    Map2D const kernel = gauss2d_kernel(21, 3.0);
    EXPECT_NEAR(kernel.sum(), 1.0, 1e-12);
    Eigen::Index row = 0;
    Eigen::Index col = 0;
    kernel.maxCoeff(&row, &col);
    EXPECT_EQ(row, 10);
    EXPECT_EQ(col, 10);
    // Half maximum at half the FWHM from the center
    Map2D const wide = gauss2d_kernel(21, 4.0);
    EXPECT_NEAR(wide(10, 12) / wide(10, 10), 0.5, 1e-12);
    EXPECT_THROW(gauss2d_kernel(0, 1.0), std::invalid_argument);
    EXPECT_THROW(gauss2d_kernel(5, -1.0), std::invalid_argument);
}

TEST(BeamTest, ConstructBeamWithDeltaApertureReturnsPsf) {
    Map2D const psf = gauss2d_kernel(16, 3.0);
    Map2D aperture = Map2D::Zero(16, 16);
    aperture(8, 8) = 5.0;
    Beam const beam = construct_beam(psf, aperture);
    EXPECT_ARRAY_NEAR(beam.beam, psf, 1e-12, "beam");
    EXPECT_THROW(construct_beam(psf, Map2D::Ones(4, 4)), std::invalid_argument);
}

TEST(BeamTest, SmearPreservesConstantField) {
    Map2D const v = Map2D::Constant(16, 16, 120.0);
    Map2D const beam = gauss2d_kernel(16, 4.0);
    SmearedMoments const moments = smear(v, beam);
    EXPECT_ARRAY_NEAR(moments.vel, v, 1e-9, "vel");
    EXPECT_FALSE(moments.sb.has_value());
    EXPECT_FALSE(moments.sig.has_value());
}

TEST(BeamTest, SmearBroadensDispersionByVelocityGradient) {
    Eigen::Index const n = 16;
    Map2D v(n, n);
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < n; ++j) { v(i, j) = 10.0 * static_cast<double>(j - n / 2); }
    }
    Map2D const sig = Map2D::Constant(n, n, 20.0);
    Map2D const sb = Map2D::Ones(n, n);
    SmearedMoments const moments = smear(v, gauss2d_kernel(n, 3.0), &sb, &sig);
    ASSERT_TRUE(moments.sig.has_value());
    ASSERT_TRUE(moments.sb.has_value());
    // Away from the wrapped edges the gradient adds to the intrinsic dispersion
    EXPECT_GT((*moments.sig)(8, 8), 20.0);
    EXPECT_NEAR(moments.vel(8, 8), 0.0, 1e-6);
    EXPECT_NEAR((*moments.sb)(8, 8), 1.0, 1e-12);
}

TEST(BeamTest, SmearRejectsMismatchedShapes) {
    Map2D const v = Map2D::Zero(8, 8);
    Map2D const sb = Map2D::Ones(6, 6);
    EXPECT_THROW(smear(v, gauss2d_kernel(8, 2.0), &sb), std::invalid_argument);
    EXPECT_THROW(smear(v, gauss2d_kernel(6, 2.0)), std::invalid_argument);
}
