/**
 * @file soil_properties.cpp
 * @brief Derived soil property checks and printing
 */

#include "swc/core/soil_properties.hpp"
#include <iomanip>
#include <ostream>

namespace swc {

bool DerivedSoilProperties::is_consistent() const {
    return points_.is_ordered()
        && points_.water_content_33 < saturated_water_content_
        && saturated_water_content_ < 1.0
        && campbell_b_ > 0.0
        && air_entry_potential_ < 0.0
        && air_entry_potential_ > constants::FIELD_CAPACITY_POTENTIAL;
}

void DerivedSoilProperties::print(std::ostream& os) const {
    auto flags = os.flags();
    os << std::fixed << std::setprecision(4);
    os << "Soil Properties:\n";
    os << "  Field capacity:     " << points_.water_content_33 << " m3/m3\n";
    os << "  Wilting point:      " << points_.water_content_1500 << " m3/m3\n";
    os << "  Saturation:         " << saturated_water_content_ << " m3/m3\n";
    os << "  Bulk density:       " << bulk_density_ << " Mg/m3\n";
    os << "  Campbell b:         " << campbell_b_ << "\n";
    os << "  Air-entry pot.:     " << air_entry_potential_ << " J/kg\n";
    os.flags(flags);
}

} // namespace swc
