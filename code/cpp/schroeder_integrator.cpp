#include "schroeder_integrator.hpp"
#include "acoustics_errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

std::vector<double> SchroederIntegrator::integrate(const std::vector<double>& energy, std::size_t t,
                                                   double C, double rms) {
    if (t > energy.size()) {
        throw std::invalid_argument("Truncation index " + std::to_string(t) +
                                    " exceeds signal length " + std::to_string(energy.size()));
    }

    std::vector<double> curve(energy.size());
    double sum = 0.0;
    for (std::size_t i = t; i > 0; --i) {
        sum += energy[i - 1] - rms;
        curve[i - 1] = sum;
    }

    // sum now holds the whole head, which is the normalization energy
    if (t > 0) {
        double total = sum + C;
        if (!(total > std::numeric_limits<double>::min())) {
            throw DegenerateInputError("Schroeder normalization energy is not positive (" +
                                       std::to_string(total) + ")");
        }
        for (std::size_t i = 0; i < t; ++i) {
            curve[i] = (curve[i] + C) / total;
        }
    }

    std::copy(energy.begin() + t, energy.end(), curve.begin() + t);
    return curve;
}
