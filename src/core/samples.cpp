/**
 * @file samples.cpp
 * @brief Batch column storage
 */

#include "swc/core/samples.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace swc {

// ============================================================================
// SoilSamples
// ============================================================================

void SoilSamples::resize(Index n) {
    clay = Vector::Zero(n);
    sand = Vector::Zero(n);
    organic_matter = Vector::Constant(n, constants::NaN);
}

void SoilSamples::check_sizes() const {
    if (sand.size() != clay.size() || organic_matter.size() != clay.size()) {
        std::ostringstream msg;
        msg << "SoilSamples column size mismatch: clay=" << clay.size()
            << ", sand=" << sand.size()
            << ", organic_matter=" << organic_matter.size();
        throw std::invalid_argument(msg.str());
    }
}

// ============================================================================
// BatchResult
// ============================================================================

Index BatchResult::n_failed() const {
    return std::count_if(samples.begin(), samples.end(),
                         [](const SampleResult& s) { return !s.success; });
}

void BatchResult::resize(Index n) {
    samples.assign(static_cast<Size>(n), SampleResult{});
    water_content_33 = Vector::Constant(n, constants::NaN);
    water_content_1500 = Vector::Constant(n, constants::NaN);
    bulk_density = Vector::Constant(n, constants::NaN);
    saturated_water_content = Vector::Constant(n, constants::NaN);
    campbell_b = Vector::Constant(n, constants::NaN);
    air_entry_potential = Vector::Constant(n, constants::NaN);
}

void BatchResult::set(Index i, const DerivedSoilProperties& props) {
    auto& s = samples[static_cast<Size>(i)];
    s.success = true;
    s.error = ErrorKind::None;
    s.message.clear();
    s.properties = props;

    water_content_33(i) = props.field_capacity();
    water_content_1500(i) = props.wilting_point();
    bulk_density(i) = props.bulk_density();
    saturated_water_content(i) = props.saturated_water_content();
    campbell_b(i) = props.campbell_b();
    air_entry_potential(i) = props.air_entry_potential();
}

void BatchResult::set_failure(Index i, const Error& err) {
    auto& s = samples[static_cast<Size>(i)];
    s.success = false;
    s.error = err.kind();
    s.message = err.what();
    s.properties.reset();
}

} // namespace swc
