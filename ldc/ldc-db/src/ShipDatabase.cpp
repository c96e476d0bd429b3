// Ticket: 0007_sqlite_ship_data_source

#include "ldc-db/src/ShipDatabase.hpp"

#include <array>
#include <string>

#include "ldc-hydro/src/HydroErrors.hpp"

namespace ldc_db
{

namespace
{

constexpr std::array<const char*, 3> kRequiredSheets{
  ldc_hydro::kParticularsSheet,
  ldc_hydro::kDisplacementSheet,
  ldc_hydro::kCrossCurveSheet};

}  // namespace

ldc_hydro::Workbook readWorkbook(const Database& db)
{
  ldc_hydro::Workbook workbook;
  for (const char* name : kRequiredSheets)
  {
    if (!db.tableExists(name))
    {
      db.getLogger()->error("Ship data is missing table '{}'", name);
      throw ldc_hydro::SchemaError(std::string{"Missing sheet '"} + name + "'");
    }
    workbook.sheets.emplace(name, db.selectAll(name));
  }
  return workbook;
}

void writeWorkbook(Database& db, const ldc_hydro::Workbook& workbook)
{
  for (const auto& [name, sheet] : workbook.sheets)
  {
    db.insertSheet(name, sheet);
  }
}

ldc_hydro::TableModel loadTableModel(const std::string& dbPath,
                                     std::shared_ptr<spdlog::logger> logger)
{
  Database db{dbPath, logger, DBOpenCondition::OpenReadOnly};
  auto model = ldc_hydro::TableModel::load(readWorkbook(db));

  const auto [minDraft, maxDraft] = model.draftRange();
  logger->info("Loaded ship data for {}: draft {}-{} m, {} heel angles",
               model.shipName(),
               minDraft,
               maxDraft,
               model.availableHeelAngles().size());
  return model;
}

}  // namespace ldc_db
