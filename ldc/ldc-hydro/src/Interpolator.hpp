// Ticket: 0004_separable_kn_interpolation

#ifndef LDC_HYDRO_INTERPOLATOR_HPP
#define LDC_HYDRO_INTERPOLATOR_HPP

#include <Eigen/Dense>

namespace ldc_hydro
{

class CrossCurveTable;

/**
 * @brief Piecewise-linear lookup in a tabulated function
 *
 * Returns ys[i] verbatim when x equals xs[i]; otherwise interpolates linearly
 * between the bracketing samples. There is no extrapolation and no clamping.
 *
 * @param x Query abscissa
 * @param xs Sample abscissae, strictly increasing
 * @param ys Sample ordinates aligned with @p xs
 * @param quantity Name of the abscissa used in the RangeError message
 * @param unit Unit suffix used in the RangeError message
 * @return Interpolated ordinate
 *
 * @throws RangeError if x < xs[0] or x > xs[n-1] (NaN is always out of range)
 * @throws std::invalid_argument if fewer than two samples or sizes differ
 */
double interp1D(double x,
                const Eigen::Ref<const Eigen::VectorXd>& xs,
                const Eigen::Ref<const Eigen::VectorXd>& ys,
                const char* quantity = "Value",
                const char* unit = "");

/**
 * @brief KN lookup across displacement and heel angle
 *
 * Separable scheme: each bracketing angle column is interpolated along the
 * displacement axis, then the two results are blended linearly by the
 * fractional position of @p angleDeg between the columns. When @p angleDeg
 * matches a column exactly that column's value is returned with no blending.
 *
 * @param displacement Displacement [t]
 * @param angleDeg Heel angle [deg]
 * @param table Cross-curve grid
 * @return KN [m]
 *
 * @throws RangeError if the angle or the displacement is outside the table
 */
double interp2D(double displacement, double angleDeg, const CrossCurveTable& table);

}  // namespace ldc_hydro

#endif  // LDC_HYDRO_INTERPOLATOR_HPP
