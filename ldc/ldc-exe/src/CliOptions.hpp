// Ticket: 0010_loadicator_cli

#ifndef LDC_EXE_CLI_OPTIONS_HPP
#define LDC_EXE_CLI_OPTIONS_HPP

#include <optional>
#include <string>
#include <vector>

#include "ldc-hydro/src/StabilityEngine.hpp"
#include "ldc-report/src/GZReport.hpp"

namespace ldc_exe
{

/// Default ship data file, relative to the executable directory
inline constexpr const char* kDefaultShipData = "data/MV_Del_Monte_Ship_Data.db";

/**
 * @brief Parsed loadicator command line
 */
struct CliOptions
{
  std::string dbPath{kDefaultShipData};
  double draft{0.0};
  ldc_report::DraftUnit draftUnit{ldc_report::DraftUnit::Meters};
  double loadMass{0.0};                     // [kg]
  std::optional<double> kgOverride;          // [m]
  std::optional<std::vector<double>> angles; // [deg]
  std::optional<std::string> csvPath;
  bool verbose{false};
  bool help{false};
  ldc_hydro::StabilityEngine::Config engine;
};

/**
 * @brief Parse arguments (without the program name)
 *
 * Options:
 *   --db PATH           ship data file
 *   --draft VALUE       draft, metres unless --feet
 *   --feet              draft is given in feet
 *   --load KG           cargo load [kg]
 *   --kg METERS         use this KG instead of the load-based estimate
 *   --angles A,B,...    heel angles [deg] instead of the tabulated set
 *   --csv PATH          also write the GZ curve as CSV
 *   --kg-base-factor F  KG fraction of draft (default 0.45)
 *   --kg-load-adjust M  KG rise per 1000 t of load [m] (default 0.05)
 *   --verbose           debug logging
 *   --help              usage
 *
 * @throws std::invalid_argument on unknown options, missing values, malformed
 *         numbers, or when --draft or --load is absent (unless --help)
 */
CliOptions parseArguments(const std::vector<std::string>& args);

/// Usage text for @p program
std::string usage(const std::string& program);

}  // namespace ldc_exe

#endif  // LDC_EXE_CLI_OPTIONS_HPP
