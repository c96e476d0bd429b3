// Ticket: 0002_table_model_errors

#ifndef LDC_HYDRO_HYDRO_ERRORS_HPP
#define LDC_HYDRO_HYDRO_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace ldc_hydro
{

/**
 * @brief Malformed or incomplete hydrostatic input
 *
 * Raised while building a TableModel when a sheet or column is missing, a
 * heel-angle label cannot be parsed, or a cell holds non-numeric data. A load
 * that throws never yields a partial table.
 */
class SchemaError final : public std::runtime_error
{
public:
  explicit SchemaError(const std::string& message)
    : std::runtime_error(message)
  {
  }
};

/**
 * @brief Lookup outside the domain of a loaded table
 *
 * Carries the attempted value and the valid closed interval. Lookups are
 * never clamped or extrapolated.
 */
class RangeError final : public std::out_of_range
{
public:
  /**
   * @param quantity Human-readable name of the looked-up quantity ("Draft")
   * @param value Attempted value
   * @param lowerBound Smallest value the table covers
   * @param upperBound Largest value the table covers
   * @param unit Unit suffix used in the message ("m", "t", "°")
   */
  RangeError(const std::string& quantity,
             double value,
             double lowerBound,
             double upperBound,
             const std::string& unit);

  [[nodiscard]] const std::string& quantity() const
  {
    return quantity_;
  }

  [[nodiscard]] double value() const
  {
    return value_;
  }

  [[nodiscard]] double lowerBound() const
  {
    return lowerBound_;
  }

  [[nodiscard]] double upperBound() const
  {
    return upperBound_;
  }

private:
  std::string quantity_;
  double value_;
  double lowerBound_;
  double upperBound_;
};

/**
 * @brief User-supplied draft or KG rejected by the pre-flight checks
 */
class ValidationError final : public std::invalid_argument
{
public:
  explicit ValidationError(const std::string& reason)
    : std::invalid_argument(reason)
  {
  }
};

}  // namespace ldc_hydro

#endif  // LDC_HYDRO_HYDRO_ERRORS_HPP
