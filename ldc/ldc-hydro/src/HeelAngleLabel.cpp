// Ticket: 0003_kn_label_normalization

#include "ldc-hydro/src/HeelAngleLabel.hpp"

#include <optional>
#include <string_view>

#include "ldc-hydro/src/HydroErrors.hpp"
#include "ldc-hydro/src/Workbook.hpp"

namespace ldc_hydro
{

namespace
{

constexpr std::string_view kDegree{kDegreeSign};
constexpr std::string_view kPrefix{kKnLabelPrefix};

std::string_view stripTrailingDegree(std::string_view text, bool& hadDegree)
{
  hadDegree = text.size() >= kDegree.size() &&
              text.substr(text.size() - kDegree.size()) == kDegree;
  if (hadDegree)
  {
    text.remove_suffix(kDegree.size());
  }
  return text;
}

std::optional<double> parseAngle(std::string_view text)
{
  // A second degree sign or prefix inside the number makes the label
  // ambiguous; cellAsNumber rejects anything that is not a bare number.
  return cellAsNumber(Cell{std::string{text}});
}

[[noreturn]] void throwUnparsable(const std::string& label)
{
  throw SchemaError("Cannot parse heel angle from KN column label '" + label +
                    "'");
}

}  // namespace

bool isHeelAngleLabel(const std::string& label)
{
  if (label.find("Displacement") != std::string::npos)
  {
    return false;
  }
  return label.find(kKnLabelPrefix) != std::string::npos ||
         label.find(kDegreeSign) != std::string::npos;
}

HeelAngleLabel parseHeelAngleLabel(const std::string& label)
{
  std::string_view text{label};

  auto first = text.find_first_not_of(" \t");
  if (first == std::string_view::npos)
  {
    throwUnparsable(label);
  }
  text.remove_prefix(first);
  text = text.substr(0, text.find_last_not_of(" \t") + 1);

  HeelAngleLabel result;
  bool hadDegree = false;

  if (text.substr(0, kPrefix.size()) == kPrefix)
  {
    result.style = HeelAngleLabel::Style::Prefixed;
    text.remove_prefix(kPrefix.size());
    text = stripTrailingDegree(text, hadDegree);
  }
  else
  {
    result.style = HeelAngleLabel::Style::Bare;
    text = stripTrailingDegree(text, hadDegree);
    if (!hadDegree)
    {
      throwUnparsable(label);
    }
  }

  auto angle = parseAngle(text);
  if (!angle)
  {
    throwUnparsable(label);
  }
  result.angleDeg = *angle;
  return result;
}

}  // namespace ldc_hydro
