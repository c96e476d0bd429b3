// Ticket: 0001_workbook_source
// Ticket: 0003_kn_label_normalization

#include "ldc-hydro/src/TableModel.hpp"

#include <algorithm>
#include <optional>

#include <fmt/format.h>

#include "ldc-hydro/src/HeelAngleLabel.hpp"
#include "ldc-hydro/src/HydroErrors.hpp"
#include "ldc-hydro/src/Interpolator.hpp"

namespace ldc_hydro
{

namespace
{

const Sheet& requireSheet(const Workbook& workbook, const char* name)
{
  const auto* sheet = workbook.findSheet(name);
  if (sheet == nullptr)
  {
    throw SchemaError(fmt::format("Missing sheet '{}'", name));
  }
  return *sheet;
}

size_t requireColumn(const Sheet& sheet, const char* sheetName, const char* column)
{
  auto index = sheet.columnIndex(column);
  if (!index)
  {
    throw SchemaError(
      fmt::format("Sheet '{}' has no column '{}'", sheetName, column));
  }
  return *index;
}

bool isBlankRow(const std::vector<Cell>& row)
{
  return std::all_of(row.begin(),
                     row.end(),
                     [](const Cell& c)
                     {
                       if (std::holds_alternative<std::monostate>(c))
                       {
                         return true;
                       }
                       const auto* text = std::get_if<std::string>(&c);
                       return text != nullptr &&
                              text->find_first_not_of(" \t") == std::string::npos;
                     });
}

// Indices of the rows that carry data; trailing spreadsheet padding is dropped
std::vector<size_t> dataRows(const Sheet& sheet)
{
  std::vector<size_t> rows;
  for (size_t r = 0; r < sheet.rows.size(); ++r)
  {
    if (!isBlankRow(sheet.rows[r]))
    {
      rows.push_back(r);
    }
  }
  return rows;
}

double requireNumber(const Sheet& sheet,
                     const char* sheetName,
                     size_t row,
                     size_t column)
{
  auto value = cellAsNumber(sheet.cell(row, column));
  if (!value)
  {
    throw SchemaError(
      fmt::format("Non-numeric value '{}' in sheet '{}', column '{}', row {}",
                  cellAsText(sheet.cell(row, column)),
                  sheetName,
                  sheet.columns[column],
                  row + 1));
  }
  return *value;
}

ShipParticulars readParticulars(const Workbook& workbook)
{
  const auto& sheet = requireSheet(workbook, kParticularsSheet);
  const auto paramCol = requireColumn(sheet, kParticularsSheet, kParameterColumn);
  const auto valueCol = requireColumn(sheet, kParticularsSheet, kValueColumn);
  const auto unitCol = sheet.columnIndex(kUnitColumn);

  ShipParticulars particulars;
  for (size_t r = 0; r < sheet.rows.size(); ++r)
  {
    const auto parameter = cellAsText(sheet.cell(r, paramCol));
    const auto& value = sheet.cell(r, valueCol);
    if (parameter.empty() || std::holds_alternative<std::monostate>(value))
    {
      continue;
    }

    ShipParticulars::Entry entry;
    if (const auto* number = std::get_if<double>(&value))
    {
      entry.value = *number;
    }
    else
    {
      const auto& text = std::get<std::string>(value);
      if (text.empty())
      {
        continue;
      }
      entry.value = text;
    }
    if (unitCol)
    {
      entry.unit = cellAsText(sheet.cell(r, *unitCol));
    }
    particulars.set(parameter, std::move(entry));
  }
  return particulars;
}

HydrostaticTable readHydrostatics(const Workbook& workbook)
{
  const auto& sheet = requireSheet(workbook, kDisplacementSheet);
  const auto draftCol = requireColumn(sheet, kDisplacementSheet, kDraftColumn);
  const auto dispCol =
    requireColumn(sheet, kDisplacementSheet, kDisplacementColumn);

  const auto rows = dataRows(sheet);
  Eigen::VectorXd drafts(static_cast<Eigen::Index>(rows.size()));
  Eigen::VectorXd displacements(static_cast<Eigen::Index>(rows.size()));
  for (size_t i = 0; i < rows.size(); ++i)
  {
    const auto idx = static_cast<Eigen::Index>(i);
    drafts(idx) = requireNumber(sheet, kDisplacementSheet, rows[i], draftCol);
    displacements(idx) =
      requireNumber(sheet, kDisplacementSheet, rows[i], dispCol);
  }
  return HydrostaticTable{std::move(drafts), std::move(displacements)};
}

CrossCurveTable readCrossCurves(const Workbook& workbook)
{
  const auto& sheet = requireSheet(workbook, kCrossCurveSheet);

  std::optional<size_t> dispCol;
  for (size_t c = 0; c < sheet.columns.size(); ++c)
  {
    if (sheet.columns[c].find("Displacement") != std::string::npos)
    {
      dispCol = c;
      break;
    }
  }
  if (!dispCol)
  {
    throw SchemaError("Displacement column not found in KN curves");
  }

  // Resolve every heel-angle header once; lookups never see the labels
  std::vector<std::pair<size_t, double>> angleColumns;
  for (size_t c = 0; c < sheet.columns.size(); ++c)
  {
    if (c == *dispCol || !isHeelAngleLabel(sheet.columns[c]))
    {
      continue;
    }
    angleColumns.emplace_back(c, parseHeelAngleLabel(sheet.columns[c]).angleDeg);
  }

  const auto rows = dataRows(sheet);
  const auto n = static_cast<Eigen::Index>(rows.size());

  Eigen::VectorXd displacements(n);
  for (Eigen::Index i = 0; i < n; ++i)
  {
    displacements(i) =
      requireNumber(sheet, kCrossCurveSheet, rows[static_cast<size_t>(i)], *dispCol);
  }

  std::vector<CrossCurveTable::Column> columns;
  columns.reserve(angleColumns.size());
  for (const auto& [c, angle] : angleColumns)
  {
    CrossCurveTable::Column column{angle, Eigen::VectorXd(n)};
    for (Eigen::Index i = 0; i < n; ++i)
    {
      column.values(i) =
        requireNumber(sheet, kCrossCurveSheet, rows[static_cast<size_t>(i)], c);
    }
    columns.push_back(std::move(column));
  }

  return CrossCurveTable{std::move(displacements), std::move(columns)};
}

}  // namespace

TableModel::TableModel(HydrostaticTable hydrostatics,
                       CrossCurveTable crossCurves,
                       ShipParticulars particulars)
  : hydrostatics_{std::move(hydrostatics)},
    crossCurves_{std::move(crossCurves)},
    particulars_{std::move(particulars)}
{
}

TableModel TableModel::load(const Workbook& workbook)
{
  auto particulars = readParticulars(workbook);
  auto hydrostatics = readHydrostatics(workbook);
  auto crossCurves = readCrossCurves(workbook);
  return TableModel{
    std::move(hydrostatics), std::move(crossCurves), std::move(particulars)};
}

double TableModel::knAt(double displacement, double angleDeg) const
{
  return interp2D(displacement, angleDeg, crossCurves_);
}

}  // namespace ldc_hydro
