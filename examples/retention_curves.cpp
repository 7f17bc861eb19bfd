/**
 * @file retention_curves.cpp
 * @brief Example: retention curves of common soil textures
 *
 * Demonstrates:
 * - Estimating soil properties from texture
 * - Converting between water potential and water content
 * - Batch evaluation with per-sample failures
 */

#include <iostream>
#include <iomanip>
#include <cmath>
#include <vector>

#include "swc/swc.hpp"

using namespace swc;

struct NamedTexture {
    const char* name;
    double clay;
    double sand;
    double organic_matter;
};

int main() {
    std::cout << "=== swc Retention Curves ===" << std::endl;

    const std::vector<NamedTexture> textures = {
        {"Loamy sand",  0.05, 0.82, 1.5},
        {"Sandy loam",  0.10, 0.60, 1.5},
        {"Loam",        0.20, 0.40, 2.5},
        {"Silty clay",  0.45, 0.10, 3.0},
    };

    // Potentials from near air entry to wilting point [J/kg]
    const std::vector<double> potentials = {-10.0, -33.0, -100.0, -500.0, -1500.0};

    SWC estimator;

    for (const auto& t : textures) {
        auto props = estimator.estimate(t.clay, t.sand, t.organic_matter);
        CampbellRetention curve(props);

        std::cout << "\n" << t.name
                  << " (clay=" << t.clay << ", sand=" << t.sand
                  << ", OM=" << t.organic_matter << "%)\n";
        props.print(std::cout);

        std::cout << "  psi [J/kg]    theta [m3/m3]\n";
        for (double psi : potentials) {
            std::cout << "  " << std::setw(10) << psi
                      << "    " << std::fixed << std::setprecision(4)
                      << curve.water_content(psi) << "\n";
            std::cout.unsetf(std::ios::fixed);
        }
    }

    // ========================================================================
    // Batch with one invalid sample
    // ========================================================================

    SoilSamples samples;
    samples.resize(4);
    samples.clay << 0.10, 0.20, 0.70, 0.45;
    samples.sand << 0.60, 0.40, 0.50, 0.10;        // third sample: clay + sand > 1
    samples.organic_matter << 1.5, std::nan(""), 2.0, 3.0;   // second: estimated

    BatchResult result = estimator.estimate_batch(samples);

    std::cout << "\nBatch: " << result.size() << " samples, "
              << result.n_failed() << " failed\n";
    for (Index i = 0; i < result.size(); ++i) {
        const auto& s = result.samples[i];
        if (s.success) {
            std::cout << "  [" << i << "] b = " << result.campbell_b(i)
                      << ", psi_e = " << result.air_entry_potential(i) << " J/kg\n";
        } else {
            std::cout << "  [" << i << "] " << to_string(s.error) << ": " << s.message << "\n";
        }
    }

    return 0;
}
