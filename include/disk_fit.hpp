#ifndef DISK_FIT_HPP
#define DISK_FIT_HPP

// Include all library headers here
#include "array_types.hpp"
#include "axisymmetric_disk.hpp"
#include "beam.hpp"
#include "bisymmetric_disk.hpp"
#include "covariance.hpp"
#include "disk_fitter.hpp"
#include "disk_model.hpp"
#include "fit_types.hpp"
#include "geometry.hpp"
#include "kinematics.hpp"
#include "oned.hpp"
#include "scatter.hpp"

// This is the main header file for the disk_fit library
// Include this single header to access all functionality

#endif // DISK_FIT_HPP
