// Ticket: 0001_workbook_source

#ifndef LDC_HYDRO_HYDROSTATIC_TABLE_HPP
#define LDC_HYDRO_HYDROSTATIC_TABLE_HPP

#include <utility>

#include <Eigen/Dense>

namespace ldc_hydro
{

/**
 * @brief Draft to displacement table
 *
 * Immutable after construction. Drafts are strictly increasing and the table
 * has at least two rows.
 */
class HydrostaticTable
{
public:
  /**
   * @param drafts Drafts [m], strictly increasing
   * @param displacements Displacements [t] aligned with @p drafts
   * @throws SchemaError if the invariants do not hold
   */
  HydrostaticTable(Eigen::VectorXd drafts, Eigen::VectorXd displacements);

  [[nodiscard]] const Eigen::VectorXd& drafts() const
  {
    return drafts_;
  }

  [[nodiscard]] const Eigen::VectorXd& displacements() const
  {
    return displacements_;
  }

  [[nodiscard]] std::pair<double, double> draftRange() const
  {
    return {drafts_(0), drafts_(drafts_.size() - 1)};
  }

  /**
   * @brief Displacement [t] at @p draft [m], linearly interpolated
   * @throws RangeError if the draft is outside draftRange()
   */
  [[nodiscard]] double displacementAt(double draft) const;

  [[nodiscard]] Eigen::Index size() const
  {
    return drafts_.size();
  }

private:
  Eigen::VectorXd drafts_;
  Eigen::VectorXd displacements_;
};

}  // namespace ldc_hydro

#endif  // LDC_HYDRO_HYDROSTATIC_TABLE_HPP
