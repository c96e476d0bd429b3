// Ticket: 0001_workbook_source
// Ticket: 0003_kn_label_normalization

#ifndef LDC_HYDRO_TABLE_MODEL_HPP
#define LDC_HYDRO_TABLE_MODEL_HPP

#include <string>
#include <utility>
#include <vector>

#include "ldc-hydro/src/CrossCurveTable.hpp"
#include "ldc-hydro/src/HydrostaticTable.hpp"
#include "ldc-hydro/src/ShipParticulars.hpp"
#include "ldc-hydro/src/Workbook.hpp"

namespace ldc_hydro
{

/**
 * @brief Validated hydrostatic data for one ship
 *
 * Bundles the draft/displacement table, the cross curves and the particulars
 * loaded from a single data source. A TableModel is built once per source and
 * handed by const reference to every computation against it; there is no
 * process-wide "current ship".
 *
 * Thread safety: immutable after construction, safe to share across threads.
 */
class TableModel
{
public:
  TableModel(HydrostaticTable hydrostatics,
             CrossCurveTable crossCurves,
             ShipParticulars particulars);

  /**
   * @brief Build a TableModel from the three logical sheets of a workbook
   *
   * Heel-angle column headers are parsed here, once; lookups use the
   * resulting angle index.
   *
   * @param workbook Sheets "Ship Particulars", "Displacement Table" and
   *        "KN Curves"
   * @return Fully validated model
   *
   * @throws SchemaError if a sheet or required column is missing, a header
   *         cannot be resolved to an angle, two headers resolve to the same
   *         angle, or a table cell is not numeric
   */
  static TableModel load(const Workbook& workbook);

  /// Draft coverage [m] of the displacement table
  [[nodiscard]] std::pair<double, double> draftRange() const
  {
    return hydrostatics_.draftRange();
  }

  /// Displacement coverage [t] of the cross curves
  [[nodiscard]] std::pair<double, double> displacementRange() const
  {
    return crossCurves_.displacementRange();
  }

  /**
   * @brief Displacement [t] at @p draft [m]
   * @throws RangeError if the draft is outside draftRange()
   */
  [[nodiscard]] double displacementAt(double draft) const
  {
    return hydrostatics_.displacementAt(draft);
  }

  /// Tabulated heel angles [deg], ascending
  [[nodiscard]] std::vector<double> availableHeelAngles() const
  {
    return crossCurves_.angleList();
  }

  /**
   * @brief KN [m] at @p displacement [t] and @p angleDeg [deg]
   * @throws RangeError if either argument is outside the cross-curve grid
   */
  [[nodiscard]] double knAt(double displacement, double angleDeg) const;

  [[nodiscard]] std::string shipName() const
  {
    return particulars_.shipName();
  }

  [[nodiscard]] const HydrostaticTable& hydrostatics() const
  {
    return hydrostatics_;
  }

  [[nodiscard]] const CrossCurveTable& crossCurves() const
  {
    return crossCurves_;
  }

  [[nodiscard]] const ShipParticulars& particulars() const
  {
    return particulars_;
  }

private:
  HydrostaticTable hydrostatics_;
  CrossCurveTable crossCurves_;
  ShipParticulars particulars_;
};

}  // namespace ldc_hydro

#endif  // LDC_HYDRO_TABLE_MODEL_HPP
