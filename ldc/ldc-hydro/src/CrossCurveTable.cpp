// Ticket: 0003_kn_label_normalization
// Ticket: 0004_separable_kn_interpolation

#include "ldc-hydro/src/CrossCurveTable.hpp"

#include <algorithm>
#include <sstream>

#include "ldc-hydro/src/HydroErrors.hpp"

namespace ldc_hydro
{

namespace
{

void requireStrictlyIncreasing(const Eigen::VectorXd& axis, const char* name)
{
  for (Eigen::Index i = 1; i < axis.size(); ++i)
  {
    if (!(axis(i) > axis(i - 1)))
    {
      std::ostringstream oss;
      oss << name << " must be strictly increasing (row " << i << ": "
          << axis(i - 1) << " -> " << axis(i) << ")";
      throw SchemaError(oss.str());
    }
  }
}

}  // namespace

CrossCurveTable::CrossCurveTable(Eigen::VectorXd displacements,
                                 std::vector<Column> columns)
  : displacements_{std::move(displacements)}
{
  if (displacements_.size() < 2)
  {
    throw SchemaError("KN curves need at least two displacement rows");
  }
  requireStrictlyIncreasing(displacements_, "KN curve displacement axis");

  if (columns.empty())
  {
    throw SchemaError("No heel angle columns found in KN curves");
  }

  std::sort(columns.begin(),
            columns.end(),
            [](const Column& a, const Column& b)
            { return a.angleDeg < b.angleDeg; });

  const auto rows = displacements_.size();
  const auto cols = static_cast<Eigen::Index>(columns.size());
  angles_.resize(cols);
  kn_.resize(rows, cols);

  for (Eigen::Index j = 0; j < cols; ++j)
  {
    const auto& column = columns[static_cast<size_t>(j)];
    if (j > 0 && column.angleDeg == angles_(j - 1))
    {
      std::ostringstream oss;
      oss << "Duplicate KN column for heel angle " << column.angleDeg << "°";
      throw SchemaError(oss.str());
    }
    if (column.values.size() != rows)
    {
      std::ostringstream oss;
      oss << "KN column for " << column.angleDeg << "° has "
          << column.values.size() << " values, expected " << rows;
      throw SchemaError(oss.str());
    }
    angles_(j) = column.angleDeg;
    kn_.col(j) = column.values;
  }
}

std::vector<double> CrossCurveTable::angleList() const
{
  return {angles_.data(), angles_.data() + angles_.size()};
}

}  // namespace ldc_hydro
