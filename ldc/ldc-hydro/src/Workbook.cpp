// Ticket: 0001_workbook_source

#include "ldc-hydro/src/Workbook.hpp"

#include <charconv>
#include <cmath>
#include <string_view>

#include <fmt/format.h>

namespace ldc_hydro
{

namespace
{

std::string_view trim(std::string_view text)
{
  constexpr std::string_view kWhitespace = " \t\r\n";
  auto first = text.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos)
  {
    return {};
  }
  auto last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

}  // namespace

std::optional<double> cellAsNumber(const Cell& cell)
{
  if (const auto* number = std::get_if<double>(&cell))
  {
    if (!std::isfinite(*number))
    {
      return std::nullopt;
    }
    return *number;
  }

  if (const auto* text = std::get_if<std::string>(&cell))
  {
    auto body = trim(*text);
    if (body.empty())
    {
      return std::nullopt;
    }
    // from_chars rejects a leading '+', spreadsheets export one occasionally
    if (body.front() == '+')
    {
      body.remove_prefix(1);
      if (body.empty() || body.front() == '+' || body.front() == '-')
      {
        return std::nullopt;
      }
    }

    double value{0.0};
    auto [ptr, ec] =
      std::from_chars(body.data(), body.data() + body.size(), value);
    if (ec != std::errc{} || ptr != body.data() + body.size() ||
        !std::isfinite(value))
    {
      return std::nullopt;
    }
    return value;
  }

  return std::nullopt;
}

std::string cellAsText(const Cell& cell)
{
  if (const auto* number = std::get_if<double>(&cell))
  {
    return fmt::format("{}", *number);
  }
  if (const auto* text = std::get_if<std::string>(&cell))
  {
    return *text;
  }
  return {};
}

}  // namespace ldc_hydro
