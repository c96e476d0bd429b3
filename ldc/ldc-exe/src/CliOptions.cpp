// Ticket: 0010_loadicator_cli

#include "ldc-exe/src/CliOptions.hpp"

#include <sstream>
#include <stdexcept>

#include "ldc-hydro/src/Workbook.hpp"

namespace ldc_exe
{

namespace
{

double parseNumber(const std::string& option, const std::string& text)
{
  auto value = ldc_hydro::cellAsNumber(ldc_hydro::Cell{text});
  if (!value)
  {
    throw std::invalid_argument("Invalid number '" + text + "' for " + option);
  }
  return *value;
}

std::vector<double> parseAngleList(const std::string& text)
{
  std::vector<double> angles;
  std::istringstream stream{text};
  std::string item;
  while (std::getline(stream, item, ','))
  {
    angles.push_back(parseNumber("--angles", item));
  }
  if (angles.empty())
  {
    throw std::invalid_argument("--angles needs at least one angle");
  }
  return angles;
}

}  // namespace

CliOptions parseArguments(const std::vector<std::string>& args)
{
  CliOptions options;
  bool haveDraft = false;
  bool haveLoad = false;

  for (size_t i = 0; i < args.size(); ++i)
  {
    const std::string& arg = args[i];

    auto value = [&]() -> const std::string&
    {
      if (i + 1 >= args.size())
      {
        throw std::invalid_argument("Missing value for " + arg);
      }
      return args[++i];
    };

    if (arg == "--help" || arg == "-h")
    {
      options.help = true;
    }
    else if (arg == "--db")
    {
      options.dbPath = value();
    }
    else if (arg == "--draft")
    {
      options.draft = parseNumber(arg, value());
      haveDraft = true;
    }
    else if (arg == "--feet")
    {
      options.draftUnit = ldc_report::DraftUnit::Feet;
    }
    else if (arg == "--load")
    {
      options.loadMass = parseNumber(arg, value());
      haveLoad = true;
    }
    else if (arg == "--kg")
    {
      options.kgOverride = parseNumber(arg, value());
    }
    else if (arg == "--angles")
    {
      options.angles = parseAngleList(value());
    }
    else if (arg == "--csv")
    {
      options.csvPath = value();
    }
    else if (arg == "--kg-base-factor")
    {
      options.engine.kgBaseFactor = parseNumber(arg, value());
    }
    else if (arg == "--kg-load-adjust")
    {
      options.engine.kgLoadAdjustment = parseNumber(arg, value());
    }
    else if (arg == "--verbose" || arg == "-v")
    {
      options.verbose = true;
    }
    else
    {
      throw std::invalid_argument("Unknown option " + arg);
    }
  }

  if (!options.help)
  {
    if (!haveDraft)
    {
      throw std::invalid_argument("--draft is required");
    }
    if (!haveLoad)
    {
      throw std::invalid_argument("--load is required");
    }
  }
  return options;
}

std::string usage(const std::string& program)
{
  return "Usage: " + program +
         " [--db PATH] --draft VALUE [--feet] --load KG [--kg METERS]\n"
         "       [--angles A,B,...] [--csv PATH] [--kg-base-factor F]\n"
         "       [--kg-load-adjust M] [--verbose]\n"
         "Example: " + program + " --draft 5.5 --load 500000\n";
}

}  // namespace ldc_exe
