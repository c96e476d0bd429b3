// Ticket: 0004_separable_kn_interpolation

#include "ldc-hydro/src/Interpolator.hpp"

#include <algorithm>
#include <stdexcept>

#include "ldc-hydro/src/CrossCurveTable.hpp"
#include "ldc-hydro/src/HydroErrors.hpp"

namespace ldc_hydro
{

double interp1D(double x,
                const Eigen::Ref<const Eigen::VectorXd>& xs,
                const Eigen::Ref<const Eigen::VectorXd>& ys,
                const char* quantity,
                const char* unit)
{
  const Eigen::Index n = xs.size();
  if (n < 2)
  {
    throw std::invalid_argument("interp1D: at least two samples required");
  }
  if (ys.size() != n)
  {
    throw std::invalid_argument("interp1D: xs and ys differ in length");
  }

  const double lower = xs(0);
  const double upper = xs(n - 1);
  if (!(x >= lower && x <= upper))
  {
    throw RangeError{quantity, x, lower, upper, unit};
  }

  const double* begin = xs.data();
  const double* it = std::lower_bound(begin, begin + n, x);
  const auto i = static_cast<Eigen::Index>(it - begin);

  if (xs(i) == x)
  {
    return ys(i);
  }

  // x > xs(0) here, so i >= 1
  const double x0 = xs(i - 1);
  const double x1 = xs(i);
  const double y0 = ys(i - 1);
  const double y1 = ys(i);
  return y0 + (y1 - y0) * (x - x0) / (x1 - x0);
}

double interp2D(double displacement, double angleDeg, const CrossCurveTable& table)
{
  const Eigen::VectorXd& angles = table.angles();
  const Eigen::Index n = angles.size();

  const double minAngle = angles(0);
  const double maxAngle = angles(n - 1);
  if (!(angleDeg >= minAngle && angleDeg <= maxAngle))
  {
    throw RangeError{"Heel angle", angleDeg, minAngle, maxAngle, "°"};
  }

  const double* begin = angles.data();
  const auto high = static_cast<Eigen::Index>(
    std::lower_bound(begin, begin + n, angleDeg) - begin);
  const Eigen::Index low = angles(high) == angleDeg ? high : high - 1;

  const double knLow = interp1D(displacement,
                                table.displacements(),
                                table.column(low),
                                "Displacement",
                                "t");
  if (low == high)
  {
    return knLow;
  }

  const double knHigh = interp1D(displacement,
                                 table.displacements(),
                                 table.column(high),
                                 "Displacement",
                                 "t");

  const double angleLow = angles(low);
  const double angleHigh = angles(high);
  return knLow +
         (knHigh - knLow) * (angleDeg - angleLow) / (angleHigh - angleLow);
}

}  // namespace ldc_hydro
