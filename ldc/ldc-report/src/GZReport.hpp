// Ticket: 0009_gz_report_output

#ifndef LDC_REPORT_GZ_REPORT_HPP
#define LDC_REPORT_GZ_REPORT_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include "ldc-hydro/src/StabilityTypes.hpp"

namespace ldc_report
{

enum class DraftUnit : uint8_t
{
  Meters,
  Feet
};

/**
 * @brief Everything a rendered stability report shows
 *
 * Carries the computed curve and summary plus the request as the user
 * entered it, so the report needs no further computation.
 */
struct ReportInput
{
  std::string shipName;
  double draftInput{0.0};  // As entered, in draftUnit
  DraftUnit draftUnit{DraftUnit::Meters};
  double draftMeters{0.0};
  double loadMass{0.0};  // [kg]
  ldc_hydro::StabilitySummary summary;
  ldc_hydro::GZCurve curve;
};

/**
 * @brief Text and CSV rendering of a GZ curve and its summary
 *
 * Summary values are rounded for display: displacement to 2 decimals, KG,
 * maximum GZ and area to 3, angles to 1. A missing vanishing angle prints as
 * "N/A".
 */
class GZReport
{
public:
  struct Config
  {
    int gzDecimals{4};       ///< Decimals for GZ values in the curve table
    char csvSeparator{','};  ///< Field separator for writeCurveCsv()
  };

  GZReport() = default;
  explicit GZReport(const Config& config);

  [[nodiscard]] std::string formatSummary(
    const ldc_hydro::StabilitySummary& summary) const;

  [[nodiscard]] std::string formatCurveTable(
    const ldc_hydro::GZCurve& curve) const;

  /**
   * @brief Write "heel_angle_deg,gz_m" followed by one row per point
   */
  void writeCurveCsv(std::ostream& out, const ldc_hydro::GZCurve& curve) const;

  [[nodiscard]] std::string formatReport(const ReportInput& input) const;

private:
  Config config_;
};

/// Vanishing angle to one decimal, or "N/A"
std::string formatVanishingAngle(const std::optional<double>& angle);

const char* unitLabel(DraftUnit unit);

}  // namespace ldc_report

#endif  // LDC_REPORT_GZ_REPORT_HPP
