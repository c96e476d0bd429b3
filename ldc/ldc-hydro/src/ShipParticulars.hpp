// Ticket: 0001_workbook_source

#ifndef LDC_HYDRO_SHIP_PARTICULARS_HPP
#define LDC_HYDRO_SHIP_PARTICULARS_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace ldc_hydro
{

/**
 * @brief Informational ship metadata keyed by parameter name
 *
 * Values are kept as loaded (text or number); nothing here feeds the
 * stability computation.
 */
class ShipParticulars
{
public:
  struct Entry
  {
    std::variant<double, std::string> value;
    std::string unit;
  };

  static constexpr const char* kShipNameKey = "Ship Name";
  static constexpr const char* kUnknownShipName = "Unknown";

  void set(const std::string& parameter, Entry entry)
  {
    entries_[parameter] = std::move(entry);
  }

  [[nodiscard]] const Entry* find(const std::string& parameter) const
  {
    auto it = entries_.find(parameter);
    return it == entries_.end() ? nullptr : &it->second;
  }

  /**
   * @brief Numeric value of @p parameter, parsing text values when needed
   */
  [[nodiscard]] std::optional<double> number(const std::string& parameter) const;

  /**
   * @brief Value of @p parameter rendered as text
   */
  [[nodiscard]] std::optional<std::string> text(const std::string& parameter) const;

  /// "Unknown" when the particulars carry no ship name
  [[nodiscard]] std::string shipName() const
  {
    return text(kShipNameKey).value_or(kUnknownShipName);
  }

  [[nodiscard]] const std::map<std::string, Entry>& entries() const
  {
    return entries_;
  }

  [[nodiscard]] size_t size() const
  {
    return entries_.size();
  }

private:
  std::map<std::string, Entry> entries_;
};

}  // namespace ldc_hydro

#endif  // LDC_HYDRO_SHIP_PARTICULARS_HPP
