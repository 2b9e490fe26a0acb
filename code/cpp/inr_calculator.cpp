#include "inr_calculator.hpp"
#include "acoustics_errors.hpp"
#include "ir_trimmer.hpp"
#include "schroeder_integrator.hpp"
#include <algorithm>
#include <cmath>

AcousticMetrics INRCalculator::calculate(const std::vector<double>& signal, double fs,
                                         const DecayPlotHook& plot_hook, const DecayAnalysisConfig& config) {
    std::vector<double> trimmed = IRTrimmer::trim(signal, config.trim_offset);
    if (trimmed.empty()) {
        throw DegenerateInputError("Nothing left of the signal after trimming");
    }

    // Normalize and square signal
    std::vector<double> power = square(normalize_peak(trimmed));

    double ln = noise_floor_db(power, config.noise_tail_fraction);

    std::vector<double> schroeder_curve = SchroederIntegrator::integrate(power, power.size());
    for (double& value : schroeder_curve) {
        value = std::abs(value); // rounding can leave the last samples slightly negative
    }
    std::vector<double> schroeder_db = power_to_db(schroeder_curve);

    DecayParameters decay = DecayTimeCalculator::calculate(schroeder_db, fs, config);

    double h0_sq = *std::max_element(power.begin(), power.end());
    const double decay_constant = 6.0 * std::log(10.0);
    double s0 = 10.0 * std::log10(decay.t20 * h0_sq / decay_constant);
    double lir = s0 + 10.0 * std::log10(decay_constant / decay.t20);

    AcousticMetrics metrics{lir - ln, lir, ln, decay};

    if (plot_hook) {
        plot_hook(DecayPlot{time_axis(power.size(), fs), power_to_db(power), schroeder_db, ln, lir});
    }
    return metrics;
}
