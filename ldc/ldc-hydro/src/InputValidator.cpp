// Ticket: 0006_input_validation

#include "ldc-hydro/src/InputValidator.hpp"

#include <array>
#include <optional>
#include <string>

#include <fmt/format.h>

#include "ldc-hydro/src/HydroErrors.hpp"

namespace ldc_hydro
{

namespace
{

// Limits print with a decimal point: 2 -> "2.0", 13.75 -> "13.75"
std::string formatLimit(double value)
{
  auto text = fmt::format("{}", value);
  if (text.find_first_of(".eEni") == std::string::npos)
  {
    text += ".0";
  }
  return text;
}

}  // namespace

ValidationResult validateInput(const TableModel& model, double draft, double kg)
{
  const auto [minDraft, maxDraft] = model.draftRange();
  const double kgLimit = 2.0 * maxDraft;

  const std::array<std::optional<std::string>, 4> failures{
    !(draft >= minDraft)
      ? std::optional{fmt::format("Draft must be at least {} meters",
                                   formatLimit(minDraft))}
      : std::nullopt,
    draft > maxDraft
      ? std::optional{fmt::format("Draft cannot exceed {} meters",
                                   formatLimit(maxDraft))}
      : std::nullopt,
    !(kg > 0.0) ? std::optional<std::string>{"KG (Vertical Center of Gravity) "
                                           "must be a positive value"}
              : std::nullopt,
    kg > kgLimit
      ? std::optional{fmt::format("KG value seems unreasonably high (should "
                                  "typically be less than {} meters)",
                                  formatLimit(kgLimit))}
      : std::nullopt};

  for (const auto& failure : failures)
  {
    if (failure)
    {
      return ValidationResult{false, *failure};
    }
  }
  return ValidationResult{};
}

void requireValidInput(const TableModel& model, double draft, double kg)
{
  auto result = validateInput(model, draft, kg);
  if (!result.ok)
  {
    throw ValidationError(result.message);
  }
}

}  // namespace ldc_hydro
