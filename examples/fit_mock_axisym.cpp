#include "disk_fit.hpp"
#include <cmath>
#include <fstream>
#include <iostream>
#include <random>

using namespace disk_fit;

int
main(int argc, char **argv) {
    std::cout << "--- Axisymmetric Disk Fit to a Mock Galaxy ---" << '\n';

    // --- 1. Fit configuration (optionally read from a JSON file) ---
    FitConfig config;
    if (argc > 1) {
        std::ifstream file(argv[1]);
        if (!file) {
            std::cerr << "Error: could not open fit configuration " << argv[1] << '\n';
            return 1;
        }
        try {
            config = fit_config_from_json(nlohmann::json::parse(file));
        } catch (const std::exception &e) {
            std::cerr << "Error reading fit configuration: " << e.what() << '\n';
            return 1;
        }
    }

    // --- 2. Generate a mock galaxy ---
    double const true_v = 220.0;
    double const true_h = 3.0;
    MockGalaxy galaxy;
    galaxy.size = 30;
    galaxy.inc = 55.0;
    galaxy.pa = 120.0;
    galaxy.vsys = 30.0;
    Eigen::Index const nbins = 100;
    Eigen::ArrayXd const edges = Eigen::ArrayXd::LinSpaced(nbins + 1, 0.0, galaxy.maxr);
    Eigen::ArrayXd const centers = (edges.head(nbins) + edges.tail(nbins)) / 2.0;
    galaxy.vt = true_v * (centers / true_h).tanh();
    galaxy.v2t = Eigen::ArrayXd::Zero(nbins);
    galaxy.v2r = Eigen::ArrayXd::Zero(nbins);
    galaxy.sig = Eigen::ArrayXd::Constant(nbins, 40.0);

    std::cout << "Generating mock with v=" << true_v << ", h=" << true_h << ", inc=" << galaxy.inc
              << ", pa=" << galaxy.pa << ", vsys=" << galaxy.vsys << '\n';

    try {
        Kinematics const mock = Kinematics::mock(galaxy);

        // Add Gaussian noise to the velocities
        double const noise = 5.0;
        std::mt19937 gen(1234);
        std::normal_distribution<double> dist(0.0, noise);
        Eigen::Index const n = mock.spatial_shape();
        // The mock is intrinsic; smear it the way the model will be smeared
        Map2D const sb = mock.remap("sb")->data;
        Map2D vel = smear(mock.remap("vel")->data, *mock.beam_fft(), config.sb_wgt ? &sb : nullptr).vel;
        for (Eigen::Index i = 0; i < vel.size(); ++i) { vel(i / n, i % n) += dist(gen); }

        KinematicsInput input;
        input.vel = vel;
        input.vel_ivar = Map2D(Map2D::Constant(n, n, 1.0 / (noise * noise)));
        input.x = mock.remap("x")->data;
        input.y = mock.remap("y")->data;
        input.sb = sb;
        input.psf = *mock.beam();
        input.bordermask = mock.remap("bordermask")->data > 0.5;
        Kinematics kin(input);
        kin.border();

        // --- 3. Fit ---
        AxisymmetricDisk disk;
        FitResult const result = lsq_fit(disk, kin, config);
        disk.apply(result);

        // --- 4. Report ---
        std::cout << '\n';
        write_report(std::cout, disk, result);
        std::cout << "Deprojected rotation amplitude: " << disk.rc_par()(0) / std::sin(deg_to_rad(disk.par()(3)))
                  << " (true " << true_v << ")" << '\n';
        std::cout << '\n' << nlohmann::json(result).dump(2) << '\n';
    } catch (const std::exception &e) {
        std::cerr << "Error fitting mock galaxy: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
