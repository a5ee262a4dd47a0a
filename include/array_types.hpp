#ifndef ARRAY_TYPES_HPP
#define ARRAY_TYPES_HPP

#include <Eigen/Core>
#include <complex>
#include <utility>

namespace disk_fit {

/**
 * @brief 2D maps are stored row-major so that flattening matches the
 * on-sky pixel order (first index = row, second index = column).
 */
using Map2D = Eigen::Array<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using ComplexMap2D = Eigen::Array<std::complex<double>, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using BoolMap = Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using IntMap = Eigen::Array<int, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

using BoolVector = Eigen::Array<bool, Eigen::Dynamic, 1>;
using IndexVector = Eigen::Array<Eigen::Index, Eigen::Dynamic, 1>;

/**
 * @brief A 2D map with a bad-pixel mask (true = ignore).
 *
 * Plays the role of a masked array for input maps and for the output of
 * Kinematics::remap.
 */
struct MaskedMap {
    Map2D data;
    BoolMap mask;

    MaskedMap() = default;

    // Unmasked map
    MaskedMap(Map2D d) // NOLINT(google-explicit-constructor)
      : data(std::move(d))
      , mask(BoolMap::Constant(data.rows(), data.cols(), false)) {}

    MaskedMap(Map2D d, BoolMap m)
      : data(std::move(d))
      , mask(std::move(m)) {}

    /// Copy of the data with masked pixels replaced by @p value.
    Map2D filled(double value) const { return mask.select(Map2D::Constant(data.rows(), data.cols(), value), data); }
};

/// Flattened (row-major) read-only view of a map.
template<typename Derived>
inline Eigen::Map<const Eigen::Array<typename Derived::Scalar, Eigen::Dynamic, 1>>
ravel(const Eigen::ArrayBase<Derived> &map) {
    static_assert(static_cast<int>(Derived::IsRowMajor) == 1, "ravel expects a row-major map");
    using Flat = Eigen::Map<const Eigen::Array<typename Derived::Scalar, Eigen::Dynamic, 1>>;
    return Flat(map.derived().data(), map.size());
}

} // namespace disk_fit

#endif // ARRAY_TYPES_HPP
