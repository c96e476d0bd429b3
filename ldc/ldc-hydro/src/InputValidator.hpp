// Ticket: 0006_input_validation

#ifndef LDC_HYDRO_INPUT_VALIDATOR_HPP
#define LDC_HYDRO_INPUT_VALIDATOR_HPP

#include <string>

#include "ldc-hydro/src/TableModel.hpp"

namespace ldc_hydro
{

/**
 * @brief Outcome of the pre-flight checks
 */
struct ValidationResult
{
  bool ok{true};
  std::string message;  // Empty when ok
};

/**
 * @brief Sanity checks on draft and KG before a GZ curve is computed
 *
 * Checks, in reporting order:
 * 1. draft >= minimum tabulated draft
 * 2. draft <= maximum tabulated draft
 * 3. kg > 0
 * 4. kg <= 2 · maximum tabulated draft (plausibility limit)
 *
 * Every check is evaluated; the message of the first failing one is returned.
 */
ValidationResult validateInput(const TableModel& model, double draft, double kg);

/**
 * @brief validateInput() that throws instead of returning the failure
 * @throws ValidationError carrying the failing check's message
 */
void requireValidInput(const TableModel& model, double draft, double kg);

}  // namespace ldc_hydro

#endif  // LDC_HYDRO_INPUT_VALIDATOR_HPP
