#include "oned.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <memory>
#include <vector>

using namespace disk_fit;

namespace {

Eigen::VectorXd
par(std::initializer_list<double> values) {
    Eigen::VectorXd v(static_cast<Eigen::Index>(values.size()));
    Eigen::Index i = 0;
    for (double const value : values) { v(i++) = value; }
    return v;
}

} // namespace

TEST(OneDTest, AllFamiliesHaveConsistentLayout) {
    std::vector<std::shared_ptr<const Func1D>> const families = {
        std::make_shared<HyperbolicTangent>(), std::make_shared<Exponential>(), std::make_shared<ExpBase>(),
        std::make_shared<Const>(),             std::make_shared<PolyEx>(),      std::make_shared<PowerExp>(),
        std::make_shared<Sersic1D>()
    };
    Eigen::ArrayXd const r = Eigen::ArrayXd::LinSpaced(20, 0.0, 30.0);
    for (const auto &f : families) {
        auto const n = static_cast<Eigen::Index>(f->np());
        EXPECT_EQ(f->guess_par().size(), n);
        EXPECT_EQ(f->lb().size(), n);
        EXPECT_EQ(f->ub().size(), n);
        EXPECT_EQ(f->par_names().size(), f->np());
        EXPECT_EQ(f->par_names(true).size(), f->np());
        EXPECT_TRUE((f->lb().array() <= f->guess_par().array()).all());
        EXPECT_TRUE((f->guess_par().array() <= f->ub().array()).all());
        EXPECT_TRUE(f->sample(r, f->guess_par()).allFinite());
        EXPECT_THROW(f->sample(r, Eigen::VectorXd::Zero(n + 1)), std::invalid_argument);
    }
}

TEST(OneDTest, HyperbolicTangentValues) {
    HyperbolicTangent const f;
    Eigen::ArrayXd r(3);
    r << 0.0, 2.0, 1000.0;
    Eigen::ArrayXd const v = f.sample(r, par({ 200.0, 2.0 }));
    EXPECT_DOUBLE_EQ(v(0), 0.0);
    EXPECT_NEAR(v(1), 200.0 * std::tanh(1.0), 1e-12);
    EXPECT_NEAR(v(2), 200.0, 1e-9);
}

TEST(OneDTest, ExponentialFamilies) {
    Eigen::ArrayXd r(2);
    r << 0.0, 5.0;
    Eigen::ArrayXd const e = Exponential().sample(r, par({ 3.0, 5.0 }));
    EXPECT_DOUBLE_EQ(e(0), 3.0);
    EXPECT_NEAR(e(1), 3.0 / std::exp(1.0), 1e-12);
    Eigen::ArrayXd const eb = ExpBase().sample(r, par({ 10.0, 3.0, 5.0 }));
    EXPECT_DOUBLE_EQ(eb(0), 13.0);
    EXPECT_NEAR(eb(1), 10.0 + 3.0 / std::exp(1.0), 1e-12);
}

TEST(OneDTest, ConstRespectsCustomBounds) {
    Const const zero(0.0, 0.0, 0.0);
    EXPECT_EQ(zero.lb()(0), 0.0);
    EXPECT_EQ(zero.ub()(0), 0.0);
    Eigen::ArrayXd const v = zero.sample(Eigen::ArrayXd::LinSpaced(4, 0, 3), zero.guess_par());
    EXPECT_TRUE((v == 0.0).all());
    EXPECT_THROW(Const(5.0, 0.0, 1.0), std::invalid_argument);
}

TEST(OneDTest, PolyExAndPowerExp) {
    Eigen::ArrayXd r(1);
    r << 4.0;
    double const s = 2.0;
    EXPECT_NEAR(PolyEx().sample(r, par({ 100.0, 2.0, 0.1 }))(0), 100.0 * (1 - std::exp(-s)) * (1 + 0.1 * s), 1e-12);
    EXPECT_NEAR(PowerExp().sample(r, par({ 10.0, 2.0, 1.5 }))(0), 10.0 * std::pow(s, 1.5) * std::exp(-s), 1e-12);
}

TEST(OneDTest, SersicHalfLightCoefficient) {
    // Exponential disk: b_1 ~ 1.678, de Vaucouleurs: b_4 ~ 7.669
    EXPECT_NEAR(Sersic1D::bn(1.0), 1.67835, 1e-4);
    EXPECT_NEAR(Sersic1D::bn(4.0), 7.66925, 1e-4);
    EXPECT_THROW(Sersic1D::bn(0.0), std::invalid_argument);

    Eigen::ArrayXd r(1);
    r << 10.0;
    // Intensity at the effective radius is I_e
    EXPECT_NEAR(Sersic1D().sample(r, par({ 2.5, 10.0, 1.0 }))(0), 2.5, 1e-12);
}
