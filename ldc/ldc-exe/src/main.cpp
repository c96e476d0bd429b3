// Ticket: 0010_loadicator_cli

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "ldc-db/src/ShipDatabase.hpp"
#include "ldc-exe/src/CliOptions.hpp"
#include "ldc-hydro/src/InputValidator.hpp"
#include "ldc-hydro/src/StabilityEngine.hpp"
#include "ldc-report/src/GZReport.hpp"
#include "ldc-utils/src/PathUtils.hpp"

int main(int argc, char* argv[])
{
  const std::string program = argc > 0 ? argv[0] : "loadicator";

  ldc_exe::CliOptions options;
  try
  {
    const std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);
    options = ldc_exe::parseArguments(args);
  }
  catch (const std::invalid_argument& e)
  {
    std::cerr << "Error: " << e.what() << "\n" << ldc_exe::usage(program);
    return 1;
  }

  if (options.help)
  {
    std::cout << ldc_exe::usage(program);
    return 0;
  }

  spdlog::set_level(options.verbose ? spdlog::level::debug
                                    : spdlog::level::warn);

  try
  {
    const auto dbPath = ldc_utils::resolveDataPath(options.dbPath);
    spdlog::debug("Ship data file: {}", dbPath.string());

    const auto model =
      ldc_db::loadTableModel(dbPath.string(), spdlog::default_logger());
    const ldc_hydro::StabilityEngine engine{model, options.engine};

    const double draftMeters =
      options.draftUnit == ldc_report::DraftUnit::Feet
        ? ldc_hydro::StabilityEngine::convertFeetToMeters(options.draft)
        : options.draft;

    const double kg = options.kgOverride.value_or(
      engine.estimateKG(options.loadMass, draftMeters));
    spdlog::debug("Draft {} m, KG {} m", draftMeters, kg);

    const auto validation = ldc_hydro::validateInput(model, draftMeters, kg);
    if (!validation.ok)
    {
      spdlog::error("Input rejected: {}", validation.message);
      std::cerr << "Input error: " << validation.message << "\n";
      return 2;
    }

    const double displacement = model.displacementAt(draftMeters);
    auto curve = engine.buildGZCurve(draftMeters, kg, options.angles);
    const auto summary = engine.summarize(curve, displacement, kg);

    const ldc_report::GZReport report;
    ldc_report::ReportInput input;
    input.shipName = model.shipName();
    input.draftInput = options.draft;
    input.draftUnit = options.draftUnit;
    input.draftMeters = draftMeters;
    input.loadMass = options.loadMass;
    input.summary = summary;
    input.curve = std::move(curve);
    std::cout << report.formatReport(input);

    if (options.csvPath)
    {
      std::ofstream csv{*options.csvPath};
      if (!csv)
      {
        throw std::runtime_error("Cannot open " + *options.csvPath +
                                 " for writing");
      }
      report.writeCurveCsv(csv, input.curve);
      spdlog::info("GZ curve written to {}", *options.csvPath);
    }

    return 0;
  }
  catch (const std::exception& e)
  {
    spdlog::error("{}", e.what());
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
