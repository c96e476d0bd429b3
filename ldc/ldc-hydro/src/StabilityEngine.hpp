// Ticket: 0005_gz_curve_and_summary

#ifndef LDC_HYDRO_STABILITY_ENGINE_HPP
#define LDC_HYDRO_STABILITY_ENGINE_HPP

#include <optional>
#include <vector>

#include "ldc-hydro/src/StabilityTypes.hpp"
#include "ldc-hydro/src/TableModel.hpp"

namespace ldc_hydro
{

/// International foot [m]
inline constexpr double kFeetToMeters = 0.3048;

/**
 * @brief Righting-arm curve and derived metrics for a loaded ship
 *
 * GZ(φ) = KN(Δ, φ) - KG · sin(φ), with Δ taken from the displacement table at
 * the requested draft and KN from the cross curves.
 *
 * KG comes from a simplified proxy, not a moment summation over compartments:
 *   KG = kgBaseFactor · T + (load_kg / 1e6) · kgLoadAdjustment
 *
 * Thread safety: const methods only; the referenced TableModel must outlive
 * the engine.
 */
class StabilityEngine
{
public:
  struct Config
  {
    double kgBaseFactor{0.45};      ///< KG as a fraction of draft
    double kgLoadAdjustment{0.05};  ///< KG rise per 1000 t of load [m]
    double areaCutoffDeg{30.0};     ///< Upper limit of the righting-energy area
  };

  explicit StabilityEngine(const TableModel& model);
  StabilityEngine(const TableModel& model, const Config& config);

  // The engine keeps a reference to the model
  StabilityEngine(TableModel&&) = delete;
  StabilityEngine(TableModel&&, const Config&) = delete;

  /**
   * @brief Estimate the vertical centre of gravity
   * @param loadMass Cargo mass [kg]
   * @param draft Draft [m]
   * @return KG [m]
   */
  [[nodiscard]] double estimateKG(double loadMass, double draft) const;

  /**
   * @brief GZ at each heel angle for a given draft and KG
   *
   * @param draft Draft [m]
   * @param kg Vertical centre of gravity [m]
   * @param angles Heel angles [deg]; the table's angles when omitted
   * @return One point per angle, in input order
   *
   * @throws RangeError if the draft, the resulting displacement, or any angle
   *         lies outside the tables. No partial curve is returned.
   */
  [[nodiscard]] GZCurve buildGZCurve(
    double draft,
    double kg,
    const std::optional<std::vector<double>>& angles = std::nullopt) const;

  /**
   * @brief Estimate KG from the load, then build the GZ curve
   * @throws RangeError as buildGZCurve()
   */
  [[nodiscard]] StabilityResult computeGZ(
    const LoadingCondition& condition,
    const std::optional<std::vector<double>>& angles = std::nullopt) const;

  /**
   * @brief Derive maximum GZ, vanishing angle and area up to the cutoff
   *
   * Area is a trapezoidal sum over consecutive pairs whose two endpoints both
   * lie at or below Config::areaCutoffDeg. A segment straddling the cutoff is
   * left out entirely.
   *
   * @throws std::invalid_argument if @p curve is empty
   */
  [[nodiscard]] StabilitySummary summarize(const GZCurve& curve,
                                           double displacement,
                                           double kg) const;

  [[nodiscard]] static double convertFeetToMeters(double feet)
  {
    return feet * kFeetToMeters;
  }

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

private:
  const TableModel& model_;
  Config config_;
};

}  // namespace ldc_hydro

#endif  // LDC_HYDRO_STABILITY_ENGINE_HPP
