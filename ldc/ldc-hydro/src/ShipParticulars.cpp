// Ticket: 0001_workbook_source

#include "ldc-hydro/src/ShipParticulars.hpp"

#include "ldc-hydro/src/Workbook.hpp"

namespace ldc_hydro
{

std::optional<double> ShipParticulars::number(const std::string& parameter) const
{
  const auto* entry = find(parameter);
  if (entry == nullptr)
  {
    return std::nullopt;
  }
  return std::visit([](const auto& v) { return cellAsNumber(Cell{v}); },
                    entry->value);
}

std::optional<std::string> ShipParticulars::text(const std::string& parameter) const
{
  const auto* entry = find(parameter);
  if (entry == nullptr)
  {
    return std::nullopt;
  }
  return std::visit([](const auto& v) { return cellAsText(Cell{v}); },
                    entry->value);
}

}  // namespace ldc_hydro
