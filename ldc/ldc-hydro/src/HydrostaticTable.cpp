// Ticket: 0001_workbook_source

#include "ldc-hydro/src/HydrostaticTable.hpp"

#include <sstream>

#include "ldc-hydro/src/HydroErrors.hpp"
#include "ldc-hydro/src/Interpolator.hpp"

namespace ldc_hydro
{

HydrostaticTable::HydrostaticTable(Eigen::VectorXd drafts,
                                   Eigen::VectorXd displacements)
  : drafts_{std::move(drafts)}, displacements_{std::move(displacements)}
{
  if (drafts_.size() < 2)
  {
    throw SchemaError("Displacement table needs at least two rows");
  }
  if (displacements_.size() != drafts_.size())
  {
    throw SchemaError("Displacement table columns differ in length");
  }
  for (Eigen::Index i = 1; i < drafts_.size(); ++i)
  {
    if (!(drafts_(i) > drafts_(i - 1)))
    {
      std::ostringstream oss;
      oss << "Draft must be strictly increasing (row " << i << ": "
          << drafts_(i - 1) << " -> " << drafts_(i) << ")";
      throw SchemaError(oss.str());
    }
  }
}

double HydrostaticTable::displacementAt(double draft) const
{
  return interp1D(draft, drafts_, displacements_, "Draft", "m");
}

}  // namespace ldc_hydro
