// Ticket: 0002_table_model_errors

#include "ldc-hydro/src/HydroErrors.hpp"

#include <fmt/format.h>

namespace ldc_hydro
{

RangeError::RangeError(const std::string& quantity,
                       double value,
                       double lowerBound,
                       double upperBound,
                       const std::string& unit)
  : std::out_of_range(fmt::format("{} {}{} is outside valid range [{}, {}]{}",
                                  quantity,
                                  value,
                                  unit,
                                  lowerBound,
                                  upperBound,
                                  unit)),
    quantity_{quantity},
    value_{value},
    lowerBound_{lowerBound},
    upperBound_{upperBound}
{
}

}  // namespace ldc_hydro
