/**
 * @file soil_properties.hpp
 * @brief Derived soil hydraulic properties
 *
 * Contains the values computed once per soil sample:
 * - Moisture points at field capacity and wilting point
 * - Bulk density and saturated water content
 * - Campbell retention parameters (b, air-entry potential)
 */

#pragma once

#include "types.hpp"
#include <iosfwd>

namespace swc {

/**
 * @brief Volumetric water contents at -33 and -1500 J/kg
 */
struct MoisturePoints {
    Real water_content_33 = 0.0;      ///< Field capacity [m³/m³]
    Real water_content_1500 = 0.0;    ///< Wilting point [m³/m³]

    /// 0 < θ1500 < θ33 < 1
    bool is_ordered() const {
        return water_content_1500 > 0.0
            && water_content_1500 < water_content_33
            && water_content_33 < 1.0;
    }
};

/**
 * @brief Parameter bundle of one soil sample
 *
 * Immutable once built; it parameterizes the CampbellRetention curve
 * for every later potential/content query on the sample.
 */
class DerivedSoilProperties {
public:
    DerivedSoilProperties(const MoisturePoints& points,
                          Real bulk_density,
                          Real saturated_water_content,
                          Real campbell_b,
                          Real air_entry_potential)
        : points_(points), bulk_density_(bulk_density),
          saturated_water_content_(saturated_water_content),
          campbell_b_(campbell_b), air_entry_potential_(air_entry_potential) {}

    const MoisturePoints& moisture_points() const { return points_; }
    Real field_capacity() const { return points_.water_content_33; }
    Real wilting_point() const { return points_.water_content_1500; }

    Real bulk_density() const { return bulk_density_; }
    Real saturated_water_content() const { return saturated_water_content_; }
    Real campbell_b() const { return campbell_b_; }
    Real air_entry_potential() const { return air_entry_potential_; }

    /// Water held between field capacity and wilting point [m³/m³]
    Real plant_available_water() const {
        return points_.water_content_33 - points_.water_content_1500;
    }

    /**
     * @brief Check the ordering and sign invariants
     *
     * θ1500 < θ33 < θs < 1, b > 0 and -33 < ψe < 0.
     */
    bool is_consistent() const;

    /// Print a one-block summary
    void print(std::ostream& os) const;

private:
    MoisturePoints points_;
    Real bulk_density_;                 ///< [Mg/m³]
    Real saturated_water_content_;      ///< [m³/m³]
    Real campbell_b_;                   ///< [-]
    Real air_entry_potential_;          ///< [J/kg]
};

} // namespace swc
