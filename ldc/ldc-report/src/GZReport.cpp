// Ticket: 0009_gz_report_output

#include "ldc-report/src/GZReport.hpp"

#include <iterator>

#include <fmt/format.h>
#include <fmt/ostream.h>

namespace ldc_report
{

GZReport::GZReport(const Config& config)
  : config_{config}
{
}

std::string formatVanishingAngle(const std::optional<double>& angle)
{
  return angle ? fmt::format("{:.1f}", *angle) : std::string{"N/A"};
}

const char* unitLabel(DraftUnit unit)
{
  switch (unit)
  {
    case DraftUnit::Feet:
      return "feet";
    case DraftUnit::Meters:
    default:
      return "meters";
  }
}

std::string GZReport::formatSummary(
  const ldc_hydro::StabilitySummary& summary) const
{
  std::string out;
  auto it = std::back_inserter(out);
  fmt::format_to(it, "Stability Summary\n");
  fmt::format_to(it, "  Displacement:              {:.2f} t\n", summary.displacement);
  fmt::format_to(it, "  KG:                        {:.3f} m\n", summary.kg);
  fmt::format_to(it,
                 "  Maximum GZ:                {:.3f} m at {:.1f} deg\n",
                 summary.maxGz,
                 summary.maxGzAngle);
  fmt::format_to(it,
                 "  Area under GZ to 30 deg:   {:.3f} m.deg\n",
                 summary.areaUnder30Deg);
  fmt::format_to(it,
                 "  Angle of vanishing stab.:  {}\n",
                 formatVanishingAngle(summary.vanishingAngle));
  return out;
}

std::string GZReport::formatCurveTable(const ldc_hydro::GZCurve& curve) const
{
  std::string out;
  auto it = std::back_inserter(out);
  fmt::format_to(it, "{:>10}  {:>12}\n", "Heel (deg)", "GZ (m)");
  for (const auto& point : curve)
  {
    fmt::format_to(it,
                   "{:>10.1f}  {:>12.{}f}\n",
                   point.heelAngle,
                   point.gz,
                   config_.gzDecimals);
  }
  return out;
}

void GZReport::writeCurveCsv(std::ostream& out,
                             const ldc_hydro::GZCurve& curve) const
{
  fmt::print(out, "heel_angle_deg{}gz_m\n", config_.csvSeparator);
  for (const auto& point : curve)
  {
    fmt::print(out,
               "{}{}{:.{}f}\n",
               point.heelAngle,
               config_.csvSeparator,
               point.gz,
               config_.gzDecimals);
  }
}

std::string GZReport::formatReport(const ReportInput& input) const
{
  std::string out;
  auto it = std::back_inserter(out);
  fmt::format_to(it, "GZ Stability Report - {}\n", input.shipName);
  if (input.draftUnit == DraftUnit::Meters)
  {
    fmt::format_to(it, "  Draft:                     {:.3f} m\n", input.draftMeters);
  }
  else
  {
    fmt::format_to(it,
                   "  Draft:                     {} {} ({:.3f} m)\n",
                   input.draftInput,
                   unitLabel(input.draftUnit),
                   input.draftMeters);
  }
  fmt::format_to(it,
                 "  Load:                      {} kg ({:.2f} t)\n",
                 input.loadMass,
                 input.loadMass / 1000.0);
  out += "\n";
  out += formatSummary(input.summary);
  out += "\n";
  out += formatCurveTable(input.curve);
  return out;
}

}  // namespace ldc_report
