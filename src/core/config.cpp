/**
 * @file config.cpp
 * @brief Configuration parsing and validation
 */

#include "swc/core/config.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <iostream>
#include <algorithm>
#include <cctype>

namespace swc {

// ============================================================================
// EstimationDecisions
// ============================================================================

void EstimationDecisions::print(std::ostream& os) const {
    os << "Estimation Decisions:\n";
    os << "  Organic matter:     " << config_io::to_string(organic_matter) << "\n";
    os << "  Saturation:         " << config_io::to_string(saturation) << "\n";
    os << "  Calibration check:  " << (check_calibration_range ? "true" : "false") << "\n";
}

// ============================================================================
// Config
// ============================================================================

Config Config::from_file(const std::filesystem::path& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filepath.string());
    }
    return config_io::parse(file);
}

Config Config::from_string(const std::string& text) {
    std::istringstream is(text);
    return config_io::parse(is);
}

void Config::to_file(const std::filesystem::path& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write config file: " + filepath.string());
    }
    file << to_string();
}

std::string Config::to_string() const {
    std::ostringstream os;
    os << "# swc Configuration File\n\n";

    os << "estimation:\n";
    os << "  organic_matter: " << config_io::to_string(estimation.organic_matter) << "\n";
    os << "  saturation: " << config_io::to_string(estimation.saturation) << "\n";
    os << "  check_calibration_range: "
       << (estimation.check_calibration_range ? "true" : "false") << "\n\n";

    os << "parallel:\n";
    os << "  num_threads: " << parallel.num_threads << "\n";
    os << "  min_batch_size: " << parallel.min_batch_size << "\n\n";

    os << "output:\n";
    os << "  verbose: " << (output.verbose ? "true" : "false") << "\n";
    return os.str();
}

bool Config::validate() const {
    if (parallel.num_threads < 0) return false;
    if (parallel.min_batch_size < 1) return false;
    return true;
}

void Config::print_summary(std::ostream& os) const {
    os << "=== swc Configuration ===\n";
    estimation.print(os);
    os << "Parallel:\n";
    os << "  Threads:   " << parallel.num_threads
       << (parallel.num_threads == 0 ? " (all)" : "") << "\n";
    os << "  Min batch: " << parallel.min_batch_size << "\n";
    os << "Output:\n";
    os << "  Verbose:   " << (output.verbose ? "true" : "false") << "\n";
    os << "=========================\n";
}

// ============================================================================
// config_io helpers
// ============================================================================

namespace config_io {

Config parse(std::istream& is) {
    Config config;

    // Simple key-value parser (no YAML library dependency)
    std::string line;
    std::string current_section;

    while (std::getline(is, line)) {
        // Strip comments
        auto comment_pos = line.find('#');
        if (comment_pos != std::string::npos) {
            line = line.substr(0, comment_pos);
        }

        // Trim whitespace
        auto start = line.find_first_not_of(" \t");
        if (start == std::string::npos) continue;
        line = line.substr(start);

        auto colon_pos = line.find(':');
        if (colon_pos == std::string::npos) continue;

        std::string key = line.substr(0, colon_pos);
        std::string value = line.substr(colon_pos + 1);

        // Trim key
        auto key_end = key.find_last_not_of(" \t");
        if (key_end != std::string::npos) {
            key = key.substr(0, key_end + 1);
        }

        // Section headers (lines ending with ':' and no value)
        auto val_start = value.find_first_not_of(" \t\r\n");
        if (val_start == std::string::npos) {
            current_section = key;
            continue;
        }
        value = value.substr(val_start);
        auto val_end = value.find_last_not_of(" \t\r\n");
        if (val_end != std::string::npos) {
            value = value.substr(0, val_end + 1);
        }

        // Parse based on section
        if (current_section == "estimation") {
            if (key == "organic_matter")
                config.estimation.organic_matter = organic_matter_from_string(value);
            else if (key == "saturation")
                config.estimation.saturation = saturation_from_string(value);
            else if (key == "check_calibration_range")
                config.estimation.check_calibration_range = bool_from_string(value);
        } else if (current_section == "parallel") {
            if (key == "num_threads")
                config.parallel.num_threads = std::stoi(value);
            else if (key == "min_batch_size")
                config.parallel.min_batch_size = std::stoll(value);
        } else if (current_section == "output") {
            if (key == "verbose")
                config.output.verbose = bool_from_string(value);
        }
    }

    return config;
}

std::string to_string(OrganicMatterSource om) {
    switch (om) {
        case OrganicMatterSource::Measured: return "Measured";
        case OrganicMatterSource::Estimated: return "Estimated";
        case OrganicMatterSource::EstimatedIfMissing: return "EstimatedIfMissing";
        default: return "Unknown";
    }
}

std::string to_string(SaturationMethod sm) {
    switch (sm) {
        case SaturationMethod::BulkDensity: return "BulkDensity";
        case SaturationMethod::Regression: return "Regression";
        default: return "Unknown";
    }
}

// String to enum converters

OrganicMatterSource organic_matter_from_string(const std::string& s) {
    if (s == "Measured") return OrganicMatterSource::Measured;
    if (s == "Estimated") return OrganicMatterSource::Estimated;
    if (s == "EstimatedIfMissing") return OrganicMatterSource::EstimatedIfMissing;
    throw std::invalid_argument("Unknown organic matter source: " + s);
}

SaturationMethod saturation_from_string(const std::string& s) {
    if (s == "BulkDensity") return SaturationMethod::BulkDensity;
    if (s == "Regression") return SaturationMethod::Regression;
    throw std::invalid_argument("Unknown saturation method: " + s);
}

bool bool_from_string(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "yes" || lower == "1") return true;
    if (lower == "false" || lower == "no" || lower == "0") return false;
    throw std::invalid_argument("Not a boolean: " + s);
}

} // namespace config_io

} // namespace swc
