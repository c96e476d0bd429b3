// Ticket: 0005_gz_curve_and_summary

#ifndef LDC_HYDRO_STABILITY_TYPES_HPP
#define LDC_HYDRO_STABILITY_TYPES_HPP

#include <optional>
#include <vector>

namespace ldc_hydro
{

/**
 * @brief Draft and cargo for a single stability request
 */
struct LoadingCondition
{
  double draft{0.0};     // [m]
  double loadMass{0.0};  // [kg]
};

/**
 * @brief One sample of the righting-arm curve
 */
struct GZPoint
{
  double heelAngle{0.0};  // [deg]
  double gz{0.0};         // [m]
};

/// Righting-arm curve, in the order the angles were requested
using GZCurve = std::vector<GZPoint>;

/**
 * @brief Scalar metrics derived from a GZ curve
 *
 * vanishingAngle is the first sampled angle with negative GZ. It is bounded
 * by the angle grid; no root is searched between samples.
 */
struct StabilitySummary
{
  double displacement{0.0};         // [t]
  double kg{0.0};                   // [m]
  double maxGz{0.0};                // [m]
  double maxGzAngle{0.0};           // [deg]
  double areaUnder30Deg{0.0};       // [m·deg]
  std::optional<double> vanishingAngle;  // [deg]
};

/**
 * @brief GZ curve together with the displacement and KG it was built from
 */
struct StabilityResult
{
  GZCurve curve;
  double displacement{0.0};  // [t]
  double kg{0.0};            // [m]
};

}  // namespace ldc_hydro

#endif  // LDC_HYDRO_STABILITY_TYPES_HPP
