// Ticket: 0005_gz_curve_and_summary

#include "ldc-hydro/src/StabilityEngine.hpp"

#include <cmath>
#include <numbers>
#include <stdexcept>

namespace ldc_hydro
{

namespace
{

constexpr double kDegToRad = std::numbers::pi / 180.0;

// Load in kg expressed in thousands of tonnes
constexpr double kKgPerThousandTonnes = 1.0e6;

}  // namespace

StabilityEngine::StabilityEngine(const TableModel& model)
  : model_{model}
{
}

StabilityEngine::StabilityEngine(const TableModel& model, const Config& config)
  : model_{model}, config_{config}
{
}

double StabilityEngine::estimateKG(double loadMass, double draft) const
{
  const double baseKg = config_.kgBaseFactor * draft;
  const double loadAdjustment =
    (loadMass / kKgPerThousandTonnes) * config_.kgLoadAdjustment;
  return baseKg + loadAdjustment;
}

GZCurve StabilityEngine::buildGZCurve(
  double draft,
  double kg,
  const std::optional<std::vector<double>>& angles) const
{
  const double displacement = model_.displacementAt(draft);
  const std::vector<double> heelAngles =
    angles.value_or(model_.availableHeelAngles());

  GZCurve curve;
  curve.reserve(heelAngles.size());
  for (double angle : heelAngles)
  {
    const double kn = model_.knAt(displacement, angle);
    curve.push_back({angle, kn - kg * std::sin(angle * kDegToRad)});
  }
  return curve;
}

StabilityResult StabilityEngine::computeGZ(
  const LoadingCondition& condition,
  const std::optional<std::vector<double>>& angles) const
{
  StabilityResult result;
  result.displacement = model_.displacementAt(condition.draft);
  result.kg = estimateKG(condition.loadMass, condition.draft);
  result.curve = buildGZCurve(condition.draft, result.kg, angles);
  return result;
}

StabilitySummary StabilityEngine::summarize(const GZCurve& curve,
                                            double displacement,
                                            double kg) const
{
  if (curve.empty())
  {
    throw std::invalid_argument("Cannot summarize an empty GZ curve");
  }

  StabilitySummary summary;
  summary.displacement = displacement;
  summary.kg = kg;

  // Strict comparison keeps the first occurrence on ties
  const GZPoint* peak = &curve.front();
  for (const auto& point : curve)
  {
    if (point.gz > peak->gz)
    {
      peak = &point;
    }
  }
  summary.maxGz = peak->gz;
  summary.maxGzAngle = peak->heelAngle;

  for (const auto& point : curve)
  {
    if (point.gz < 0.0)
    {
      summary.vanishingAngle = point.heelAngle;
      break;
    }
  }

  double area = 0.0;
  for (size_t i = 0; i + 1 < curve.size(); ++i)
  {
    const auto& a = curve[i];
    const auto& b = curve[i + 1];
    if (a.heelAngle <= config_.areaCutoffDeg &&
        b.heelAngle <= config_.areaCutoffDeg)
    {
      area += (a.gz + b.gz) / 2.0 * (b.heelAngle - a.heelAngle);
    }
  }
  summary.areaUnder30Deg = area;

  return summary;
}

}  // namespace ldc_hydro
