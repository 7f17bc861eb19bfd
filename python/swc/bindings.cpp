/**
 * @file bindings.cpp
 * @brief Python bindings for swc using pybind11
 *
 * Provides Python interface for:
 * - Pedotransfer functions (Saxton & Rawls 2006)
 * - Campbell retention curve in both directions
 * - The SWC estimator and its batch API (NumPy columns)
 * - Vapor pressure helpers
 */

#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include "swc/swc.hpp"
#include <cstring>

namespace py = pybind11;
using namespace swc;

// ============================================================================
// Helper Functions
// ============================================================================

/// Convert Eigen Vector to NumPy array
py::array_t<double> vector_to_numpy(const Vector& vec) {
    return py::array_t<double>(vec.size(), vec.data());
}

using DenseArray = py::array_t<double, py::array::c_style | py::array::forcecast>;

/// Convert NumPy array to Eigen Vector (strided views are copied contiguous first)
Vector numpy_to_vector(DenseArray arr) {
    py::buffer_info buf = arr.request();
    Vector vec(buf.size);
    std::memcpy(vec.data(), buf.ptr, buf.size * sizeof(double));
    return vec;
}

// ============================================================================
// Python Module Definition
// ============================================================================

PYBIND11_MODULE(swc_py, m) {
    m.doc() = R"pbdoc(
        swc: Soil Water Characteristic estimator
        ========================================

        Soil hydraulic properties from clay, sand and organic matter.

        Features:
        - Field capacity, wilting point, bulk density, saturation
        - Campbell b and air-entry potential
        - Potential <-> content conversion
        - Parallel batch evaluation

        Example:
            >>> import swc_py as swc
            >>> props = swc.SWC().estimate(0.2, 0.4, 2.5)
            >>> curve = swc.CampbellRetention(props)
            >>> curve.water_potential(0.25)
    )pbdoc";

    // ========================================================================
    // Exceptions
    // ========================================================================

    auto base_error = py::register_exception<Error>(m, "SoilWaterError", PyExc_ValueError);
    py::register_exception<InvalidTextureError>(m, "InvalidTextureError", base_error.ptr());
    auto domain_error = py::register_exception<DomainError>(m, "DomainError", base_error.ptr());
    py::register_exception<InvalidArgumentError>(m, "InvalidArgumentError", domain_error.ptr());
    py::register_exception<ArithmeticError>(m, "ArithmeticError", PyExc_ArithmeticError);

    // ========================================================================
    // Enums
    // ========================================================================

    py::enum_<OrganicMatterSource>(m, "OrganicMatterSource")
        .value("Measured", OrganicMatterSource::Measured)
        .value("Estimated", OrganicMatterSource::Estimated)
        .value("EstimatedIfMissing", OrganicMatterSource::EstimatedIfMissing)
        .export_values();

    py::enum_<SaturationMethod>(m, "SaturationMethod")
        .value("BulkDensity", SaturationMethod::BulkDensity)
        .value("Regression", SaturationMethod::Regression)
        .export_values();

    py::enum_<ErrorKind>(m, "ErrorKind")
        .value("None_", ErrorKind::None)
        .value("InvalidTexture", ErrorKind::InvalidTexture)
        .value("Domain", ErrorKind::Domain)
        .value("Arithmetic", ErrorKind::Arithmetic)
        .value("InvalidArgument", ErrorKind::InvalidArgument);

    // ========================================================================
    // Configuration
    // ========================================================================

    py::class_<EstimationDecisions>(m, "EstimationDecisions")
        .def(py::init<>())
        .def_readwrite("organic_matter", &EstimationDecisions::organic_matter)
        .def_readwrite("saturation", &EstimationDecisions::saturation)
        .def_readwrite("check_calibration_range", &EstimationDecisions::check_calibration_range);

    py::class_<ParallelConfig>(m, "ParallelConfig")
        .def(py::init<>())
        .def_readwrite("num_threads", &ParallelConfig::num_threads)
        .def_readwrite("min_batch_size", &ParallelConfig::min_batch_size);

    py::class_<OutputConfig>(m, "OutputConfig")
        .def(py::init<>())
        .def_readwrite("verbose", &OutputConfig::verbose);

    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_static("from_file", [](const std::string& path) { return Config::from_file(path); })
        .def_static("from_string", &Config::from_string)
        .def("to_file", [](const Config& c, const std::string& path) { c.to_file(path); })
        .def("to_string", &Config::to_string)
        .def("validate", &Config::validate)
        .def_readwrite("estimation", &Config::estimation)
        .def_readwrite("parallel", &Config::parallel)
        .def_readwrite("output", &Config::output);

    // ========================================================================
    // Soil Values
    // ========================================================================

    py::class_<TextureComposition>(m, "TextureComposition")
        .def(py::init(&TextureComposition::create),
             py::arg("clay"), py::arg("sand"), py::arg("organic_matter"))
        .def_property_readonly("clay", &TextureComposition::clay)
        .def_property_readonly("sand", &TextureComposition::sand)
        .def_property_readonly("silt", &TextureComposition::silt)
        .def_property_readonly("organic_matter", &TextureComposition::organic_matter);

    py::class_<MoisturePoints>(m, "MoisturePoints")
        .def_readonly("water_content_33", &MoisturePoints::water_content_33)
        .def_readonly("water_content_1500", &MoisturePoints::water_content_1500)
        .def("is_ordered", &MoisturePoints::is_ordered);

    py::class_<DerivedSoilProperties>(m, "DerivedSoilProperties")
        .def_property_readonly("field_capacity", &DerivedSoilProperties::field_capacity)
        .def_property_readonly("wilting_point", &DerivedSoilProperties::wilting_point)
        .def_property_readonly("bulk_density", &DerivedSoilProperties::bulk_density)
        .def_property_readonly("saturated_water_content",
                               &DerivedSoilProperties::saturated_water_content)
        .def_property_readonly("campbell_b", &DerivedSoilProperties::campbell_b)
        .def_property_readonly("air_entry_potential",
                               &DerivedSoilProperties::air_entry_potential)
        .def_property_readonly("plant_available_water",
                               &DerivedSoilProperties::plant_available_water)
        .def("is_consistent", &DerivedSoilProperties::is_consistent)
        .def("__repr__", [](const DerivedSoilProperties& p) {
            return "<DerivedSoilProperties theta_s=" + std::to_string(p.saturated_water_content())
                 + " b=" + std::to_string(p.campbell_b())
                 + " psi_e=" + std::to_string(p.air_entry_potential()) + ">";
        });

    // ========================================================================
    // Retention Curve
    // ========================================================================

    py::class_<CampbellRetention>(m, "CampbellRetention")
        .def(py::init<Real, Real, Real>(), py::arg("theta_s"), py::arg("psi_e"), py::arg("b"))
        .def(py::init<const DerivedSoilProperties&>())
        .def("water_potential", &CampbellRetention::water_potential)
        .def("water_content", &CampbellRetention::water_content)
        .def("moisture_capacity", &CampbellRetention::moisture_capacity)
        .def("water_potential_vec", [](const CampbellRetention& c, DenseArray theta) {
            return vector_to_numpy(c.water_potential_vec(numpy_to_vector(theta)));
        })
        .def("water_content_vec", [](const CampbellRetention& c, DenseArray psi) {
            return vector_to_numpy(c.water_content_vec(numpy_to_vector(psi)));
        })
        .def_property_readonly("theta_s", &CampbellRetention::theta_s)
        .def_property_readonly("psi_e", &CampbellRetention::psi_e)
        .def_property_readonly("b", &CampbellRetention::b);

    // ========================================================================
    // Free Functions
    // ========================================================================

    m.def("water_content_33",
          py::overload_cast<Real, Real, Real>(&pedotransfer::water_content_33),
          py::arg("clay"), py::arg("sand"), py::arg("organic_matter"));
    m.def("water_content_1500",
          py::overload_cast<Real, Real, Real>(&pedotransfer::water_content_1500),
          py::arg("clay"), py::arg("sand"), py::arg("organic_matter"));
    m.def("bulk_density",
          py::overload_cast<Real, Real, Real>(&pedotransfer::bulk_density),
          py::arg("clay"), py::arg("sand"), py::arg("organic_matter"));
    m.def("organic_matter_estimate", &pedotransfer::organic_matter_estimate, py::arg("clay"));
    m.def("saturated_water_content", py::overload_cast<Real>(&saturated_water_content),
          py::arg("bulk_density"));
    m.def("b_value", &b_value, py::arg("water_content_33"), py::arg("water_content_1500"));
    m.def("air_entry_potential", &air_entry_potential,
          py::arg("field_capacity"), py::arg("saturated_water_content"), py::arg("b"));

    m.def("vapor_pressure_air", &atmosphere::vapor_pressure_air,
          py::arg("vp_temp_min"), py::arg("vp_temp_max"), py::arg("rh_max"), py::arg("rh_min"));
    m.def("mean_vapor_pressure_deficit", &atmosphere::mean_vapor_pressure_deficit,
          py::arg("max_sat_vp"), py::arg("min_sat_vp"), py::arg("air_vp"));
    m.def("max_vapor_pressure_deficit", &atmosphere::max_vapor_pressure_deficit,
          py::arg("max_sat_vp"), py::arg("min_rh"));

    // ========================================================================
    // Main Estimator
    // ========================================================================

    py::class_<SWC>(m, "SWC")
        .def(py::init<>())
        .def(py::init<const Config&>())
        .def_static("from_config", &SWC::from_config)
        .def("config", &SWC::config)
        .def("estimate", py::overload_cast<Real, Real, Real>(&SWC::estimate, py::const_),
             py::arg("clay"), py::arg("sand"), py::arg("organic_matter"))
        .def("estimate_batch", [](const SWC& self,
                                  DenseArray clay,
                                  DenseArray sand,
                                  DenseArray organic_matter) {
            SoilSamples samples;
            samples.clay = numpy_to_vector(clay);
            samples.sand = numpy_to_vector(sand);
            samples.organic_matter = numpy_to_vector(organic_matter);

            BatchResult result = self.estimate_batch(samples);

            py::dict out;
            out["water_content_33"] = vector_to_numpy(result.water_content_33);
            out["water_content_1500"] = vector_to_numpy(result.water_content_1500);
            out["bulk_density"] = vector_to_numpy(result.bulk_density);
            out["saturated_water_content"] = vector_to_numpy(result.saturated_water_content);
            out["campbell_b"] = vector_to_numpy(result.campbell_b);
            out["air_entry_potential"] = vector_to_numpy(result.air_entry_potential);

            py::list errors;
            for (const auto& s : result.samples) {
                errors.append(s.success ? py::none() : py::cast(s.message));
            }
            out["errors"] = errors;
            return out;
        });
}
