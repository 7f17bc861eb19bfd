/**
 * @file vapor_pressure.hpp
 * @brief Air vapor pressure and vapor pressure deficit
 *
 * Daily atmospheric demand terms used alongside soil water content by
 * crop water-stress models. Independent of the soil estimators.
 *
 * Reference: Campbell, G.S., Norman, J.M., 1998. Introduction to
 * environmental biophysics. Springer, New York.
 *
 * All pressures in kPa, relative humidity in percent (0-100). No
 * validation beyond the arithmetic.
 */

#pragma once

#include "../core/types.hpp"

namespace swc {

namespace atmosphere {

/**
 * @brief Vapor pressure of air [kPa]
 *
 * Mean of the saturated vapor pressure at Tmin scaled by RHmax and the
 * one at Tmax scaled by RHmin.
 *
 * @param vp_temp_min Saturated vapor pressure at minimum temperature [kPa]
 * @param vp_temp_max Saturated vapor pressure at maximum temperature [kPa]
 * @param rh_max Maximum relative humidity [%]
 * @param rh_min Minimum relative humidity [%]
 */
Real vapor_pressure_air(Real vp_temp_min, Real vp_temp_max, Real rh_max, Real rh_min);

/// Mean daily vapor pressure deficit [kPa]
Real mean_vapor_pressure_deficit(Real max_sat_vp, Real min_sat_vp, Real air_vp);

/// Maximum daily vapor pressure deficit [kPa]
Real max_vapor_pressure_deficit(Real max_sat_vp, Real min_rh);

} // namespace atmosphere

} // namespace swc
