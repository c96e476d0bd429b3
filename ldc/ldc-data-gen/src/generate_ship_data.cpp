// Ticket: 0008_sample_ship_data

#include <filesystem>
#include <iostream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "ldc-data-gen/src/SampleShipData.hpp"
#include "ldc-db/src/Database.hpp"
#include "ldc-db/src/ShipDatabase.hpp"

/**
 * @brief Sample ship data generator
 *
 * Writes the MV Del Monte ship data file used as the loadicator's default
 * data source: particulars, draft/displacement table and KN cross curves,
 * one SQLite table per sheet.
 *
 * Usage: generate_ship_data <output_database_path>
 */
int main(int argc, char* argv[])
{
  if (argc != 2)
  {
    std::cerr << "Usage: " << argv[0] << " <output_database_path>" << "\n";
    std::cerr << "Example: " << argv[0] << " MV_Del_Monte_Ship_Data.db" << "\n";
    return 1;
  }

  const std::string dbPath = argv[1];

  try
  {
    if (std::filesystem::exists(dbPath))
    {
      std::cerr << "Error: " << dbPath << " already exists" << "\n";
      return 1;
    }

    const auto parent = std::filesystem::path(dbPath).parent_path();
    if (!parent.empty())
    {
      std::filesystem::create_directories(parent);
    }

    auto logger = spdlog::stdout_color_mt("generate_ship_data");

    std::cout << "Creating ship data file: " << dbPath << "\n";
    ldc_db::Database db{dbPath, logger, ldc_db::DBOpenCondition::OpenCreate};

    const auto workbook = ldc_data_gen::makeDelMonteWorkbook();
    ldc_db::writeWorkbook(db, workbook);

    for (const auto& [name, sheet] : workbook.sheets)
    {
      std::cout << "  " << name << ": " << sheet.rows.size() << " rows x "
                << sheet.columns.size() << " columns\n";
    }

    std::cout << "\nShip data file created successfully!" << "\n";
    return 0;
  }
  catch (const std::exception& e)
  {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
