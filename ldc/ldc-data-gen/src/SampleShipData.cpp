// Ticket: 0008_sample_ship_data

#include "ldc-data-gen/src/SampleShipData.hpp"

#include <array>
#include <cmath>
#include <numbers>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Dense>
#include <fmt/format.h>

namespace ldc_data_gen
{

namespace
{

constexpr int kKnDisplacementPoints = 50;
constexpr double kKnBaseFactor = 0.015;
constexpr double kKnDisplacementExponent = 0.4;

constexpr std::array<double, 25> kDrafts{
  2.0, 2.5, 3.0, 3.5, 4.0, 4.5, 5.0, 5.5, 6.0, 6.5, 7.0, 7.5, 8.0,
  8.5, 9.0, 9.5, 10.0, 10.5, 11.0, 11.5, 12.0, 12.5, 13.0, 13.5, 14.0};

constexpr std::array<double, 25> kDisplacements{
  10497,  13135,  16107,  19413,  23052,  27025,  31331,
  35971,  40944,  46251,  51891,  57865,  64172,  70813,
  77787,  85094,  92735,  100710, 109018, 117659, 126634,
  135943, 145585, 155560, 165869};

ldc_hydro::Sheet particularsSheet()
{
  ldc_hydro::Sheet sheet;
  sheet.columns = {"Parameter", "Value", "Unit"};

  auto add = [&sheet](const char* parameter, const char* value, const char* unit)
  {
    sheet.rows.push_back({std::string{parameter},
                          std::string{value},
                          std::string{unit}});
  };
  add("Ship Name", "MV Del Monte", "");
  add("Length Overall (LOA)", "120.0", "m");
  add("Length Between Perpendiculars (LBP)", "115.0", "m");
  add("Breadth", "20.0", "m");
  add("Depth", "10.0", "m");
  add("Design Draft", "6.0", "m");
  add("Lightship Weight", "2500", "tonnes");
  add("Deadweight", "5000", "tonnes");
  return sheet;
}

ldc_hydro::Sheet displacementSheet()
{
  ldc_hydro::Sheet sheet;
  sheet.columns = {"Draft (m)", "Displacement (tonnes)"};
  for (size_t i = 0; i < kDrafts.size(); ++i)
  {
    sheet.rows.push_back({kDrafts[i], kDisplacements[i]});
  }
  return sheet;
}

ldc_hydro::Sheet crossCurveSheet()
{
  const Eigen::VectorXd displacements = Eigen::VectorXd::LinSpaced(
    kKnDisplacementPoints, kDisplacements.front(), kDisplacements.back());

  ldc_hydro::Sheet sheet;
  sheet.columns.emplace_back("Displacement (tonnes)");
  for (int angle = 10; angle <= 60; angle += 5)
  {
    sheet.columns.push_back(fmt::format("KN at {}°", angle));
  }

  for (Eigen::Index i = 0; i < displacements.size(); ++i)
  {
    const double disp = displacements(i);
    std::vector<ldc_hydro::Cell> row{disp};
    for (int angle = 10; angle <= 60; angle += 5)
    {
      const double rad = angle * std::numbers::pi / 180.0;
      row.emplace_back(kKnBaseFactor *
                       std::pow(disp, kKnDisplacementExponent) *
                       std::sin(rad));
    }
    sheet.rows.push_back(std::move(row));
  }
  return sheet;
}

}  // namespace

ldc_hydro::Workbook makeDelMonteWorkbook()
{
  ldc_hydro::Workbook workbook;
  workbook.sheets.emplace(ldc_hydro::kParticularsSheet, particularsSheet());
  workbook.sheets.emplace(ldc_hydro::kDisplacementSheet, displacementSheet());
  workbook.sheets.emplace(ldc_hydro::kCrossCurveSheet, crossCurveSheet());
  return workbook;
}

}  // namespace ldc_data_gen
