// Ticket: 0003_kn_label_normalization
// Ticket: 0004_separable_kn_interpolation

#ifndef LDC_HYDRO_CROSS_CURVE_TABLE_HPP
#define LDC_HYDRO_CROSS_CURVE_TABLE_HPP

#include <utility>
#include <vector>

#include <Eigen/Dense>

namespace ldc_hydro
{

/**
 * @brief Cross curves of stability: KN over displacement and heel angle
 *
 * Stored as a displacement axis and a KN grid whose rows follow the axis and
 * whose columns follow the heel angles in ascending order. Column order in the
 * source is irrelevant; the angle index is built once at construction.
 *
 * Immutable after construction and safe to share between threads.
 */
class CrossCurveTable
{
public:
  /**
   * @brief KN samples for one heel angle
   */
  struct Column
  {
    double angleDeg{0.0};
    Eigen::VectorXd values;
  };

  /**
   * @brief Build and validate the grid
   * @param displacements Displacement axis [t], strictly increasing, >= 2 rows
   * @param columns One entry per heel angle, any order, distinct angles
   * @throws SchemaError if the axis is not strictly increasing, no columns are
   *         given, an angle repeats, or a column length differs from the axis
   */
  CrossCurveTable(Eigen::VectorXd displacements, std::vector<Column> columns);

  [[nodiscard]] const Eigen::VectorXd& displacements() const
  {
    return displacements_;
  }

  /// Heel angles [deg], ascending
  [[nodiscard]] const Eigen::VectorXd& angles() const
  {
    return angles_;
  }

  /// KN grid [m], rows = displacement, columns = angle
  [[nodiscard]] const Eigen::MatrixXd& kn() const
  {
    return kn_;
  }

  [[nodiscard]] Eigen::MatrixXd::ConstColXpr column(Eigen::Index angleIndex) const
  {
    return kn_.col(angleIndex);
  }

  [[nodiscard]] std::pair<double, double> displacementRange() const
  {
    return {displacements_(0), displacements_(displacements_.size() - 1)};
  }

  [[nodiscard]] std::vector<double> angleList() const;

  /**
   * @brief KN at a tabulated grid point, no interpolation
   */
  [[nodiscard]] double at(Eigen::Index row, Eigen::Index angleIndex) const
  {
    return kn_(row, angleIndex);
  }

private:
  Eigen::VectorXd displacements_;
  Eigen::VectorXd angles_;
  Eigen::MatrixXd kn_;
};

}  // namespace ldc_hydro

#endif  // LDC_HYDRO_CROSS_CURVE_TABLE_HPP
