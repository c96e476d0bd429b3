// Ticket: 0001_workbook_source

#ifndef LDC_HYDRO_WORKBOOK_HPP
#define LDC_HYDRO_WORKBOOK_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ldc_hydro
{

/// Sheet names every ship data source must provide
inline constexpr const char* kParticularsSheet = "Ship Particulars";
inline constexpr const char* kDisplacementSheet = "Displacement Table";
inline constexpr const char* kCrossCurveSheet = "KN Curves";

/// Column names of the fixed-layout sheets
inline constexpr const char* kParameterColumn = "Parameter";
inline constexpr const char* kValueColumn = "Value";
inline constexpr const char* kUnitColumn = "Unit";
inline constexpr const char* kDraftColumn = "Draft (m)";
inline constexpr const char* kDisplacementColumn = "Displacement (tonnes)";

/**
 * @brief A single spreadsheet cell: empty, numeric or text
 */
using Cell = std::variant<std::monostate, double, std::string>;

/**
 * @brief One named table of cells with a header row
 *
 * Rows may be shorter than the header; missing trailing cells read as empty.
 */
struct Sheet
{
  std::vector<std::string> columns;
  std::vector<std::vector<Cell>> rows;

  /**
   * @brief Position of the column whose header equals @p name
   */
  [[nodiscard]] std::optional<size_t> columnIndex(const std::string& name) const
  {
    for (size_t i = 0; i < columns.size(); ++i)
    {
      if (columns[i] == name)
      {
        return i;
      }
    }
    return std::nullopt;
  }

  /**
   * @brief Cell at (@p row, @p column), empty if the row is short
   */
  [[nodiscard]] const Cell& cell(size_t row, size_t column) const
  {
    static const Cell empty{};
    const auto& r = rows.at(row);
    return column < r.size() ? r[column] : empty;
  }
};

/**
 * @brief In-memory form of a ship data workbook
 *
 * This is the hand-off point between a data-loading collaborator (SQLite,
 * spreadsheet export, test fixture) and TableModel::load().
 */
struct Workbook
{
  std::map<std::string, Sheet> sheets;

  [[nodiscard]] const Sheet* findSheet(const std::string& name) const
  {
    auto it = sheets.find(name);
    return it == sheets.end() ? nullptr : &it->second;
  }
};

/**
 * @brief Numeric value of a cell, parsing text cells that hold a number
 * @return std::nullopt for empty cells and non-numeric text
 */
std::optional<double> cellAsNumber(const Cell& cell);

/**
 * @brief Text rendering of a cell; numbers use their shortest round-trip form
 */
std::string cellAsText(const Cell& cell);

}  // namespace ldc_hydro

#endif  // LDC_HYDRO_WORKBOOK_HPP
