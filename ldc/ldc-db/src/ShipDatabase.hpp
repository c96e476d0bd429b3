// Ticket: 0007_sqlite_ship_data_source

#ifndef LDC_DB_SHIP_DATABASE_HPP
#define LDC_DB_SHIP_DATABASE_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "ldc-db/src/Database.hpp"
#include "ldc-hydro/src/TableModel.hpp"
#include "ldc-hydro/src/Workbook.hpp"

namespace ldc_db
{

/**
 * @brief Read the three ship data sheets from an open database
 *
 * Each sheet is a table named after it ("Ship Particulars",
 * "Displacement Table", "KN Curves") whose column names are the sheet headers.
 *
 * @throws ldc_hydro::SchemaError if one of the tables is missing
 * @throws std::runtime_error if a table cannot be read
 */
ldc_hydro::Workbook readWorkbook(const Database& db);

/**
 * @brief Store every sheet of @p workbook as a table of the same name
 * @throws std::runtime_error if a table exists already or an insert fails
 */
void writeWorkbook(Database& db, const ldc_hydro::Workbook& workbook);

/**
 * @brief Open a ship data file read-only and build its TableModel
 *
 * The connection is closed before returning; the model owns copies of all
 * tables.
 *
 * @param dbPath Path to the SQLite ship data file
 * @param logger Logger for the connection
 * @throws std::runtime_error if the file cannot be opened or read
 * @throws ldc_hydro::SchemaError if the data does not form a valid model
 */
ldc_hydro::TableModel loadTableModel(const std::string& dbPath,
                                     std::shared_ptr<spdlog::logger> logger);

}  // namespace ldc_db

#endif  // LDC_DB_SHIP_DATABASE_HPP
