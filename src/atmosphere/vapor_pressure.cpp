/**
 * @file vapor_pressure.cpp
 * @brief Vapor pressure functions
 */

#include "swc/atmosphere/vapor_pressure.hpp"

namespace swc {

namespace atmosphere {

Real vapor_pressure_air(Real vp_temp_min, Real vp_temp_max, Real rh_max, Real rh_min) {
    return 0.5 * (vp_temp_min * rh_max / 100.0 + vp_temp_max * rh_min / 100.0);
}

Real mean_vapor_pressure_deficit(Real max_sat_vp, Real min_sat_vp, Real air_vp) {
    return (max_sat_vp + min_sat_vp) / 2.0 - air_vp;
}

Real max_vapor_pressure_deficit(Real max_sat_vp, Real min_rh) {
    return 0.67 * max_sat_vp * (1.0 - min_rh / 100.0);
}

} // namespace atmosphere

} // namespace swc
