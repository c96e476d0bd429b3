// Ticket: 0003_kn_label_normalization

#ifndef LDC_HYDRO_HEEL_ANGLE_LABEL_HPP
#define LDC_HYDRO_HEEL_ANGLE_LABEL_HPP

#include <cstdint>
#include <string>

namespace ldc_hydro
{

/// UTF-8 encoding of the degree sign used in cross-curve headers
inline constexpr const char* kDegreeSign = "°";

/// Prefix of the long-form cross-curve header ("KN at 10°")
inline constexpr const char* kKnLabelPrefix = "KN at";

/**
 * @brief A cross-curve column header resolved to its heel angle
 */
struct HeelAngleLabel
{
  enum class Style : uint8_t
  {
    Prefixed,  // "KN at 10°"
    Bare       // "10°"
  };

  double angleDeg{0.0};
  Style style{Style::Bare};
};

/**
 * @brief True when @p label names a heel-angle column
 *
 * A header is a heel-angle column when it carries the "KN at" prefix or a
 * degree sign. Headers naming the displacement axis never qualify.
 */
bool isHeelAngleLabel(const std::string& label);

/**
 * @brief Resolve a heel-angle column header to its numeric angle
 *
 * Accepts "KN at {angle}°" (degree sign optional) and "{angle}°". Whitespace
 * around the number is ignored. Both forms of the same angle yield the same
 * value.
 *
 * @throws SchemaError if the header is not one of the two forms or the angle
 *         is not a finite number
 */
HeelAngleLabel parseHeelAngleLabel(const std::string& label);

}  // namespace ldc_hydro

#endif  // LDC_HYDRO_HEEL_ANGLE_LABEL_HPP
