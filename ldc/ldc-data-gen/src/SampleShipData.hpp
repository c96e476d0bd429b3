// Ticket: 0008_sample_ship_data

#ifndef LDC_DATA_GEN_SAMPLE_SHIP_DATA_HPP
#define LDC_DATA_GEN_SAMPLE_SHIP_DATA_HPP

#include "ldc-hydro/src/Workbook.hpp"

namespace ldc_data_gen
{

/**
 * @brief Ship data workbook for the MV Del Monte
 *
 * Contents:
 * - "Ship Particulars": name, main dimensions, lightship and deadweight
 * - "Displacement Table": 25 drafts from 2.0 m to 14.0 m in 0.5 m steps
 * - "KN Curves": simulated cross curves, 50 displacements spaced evenly over
 *   the displacement table's range, heel angles 10° to 60° in 5° steps,
 *   KN = 0.015 · Δ^0.4 · sin(φ), headers in the "KN at {angle}°" form
 */
ldc_hydro::Workbook makeDelMonteWorkbook();

}  // namespace ldc_data_gen

#endif  // LDC_DATA_GEN_SAMPLE_SHIP_DATA_HPP
