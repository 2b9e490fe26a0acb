#include "decay_time_calculator.hpp"
#include "acoustics_errors.hpp"
#include "schroeder_integrator.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

DecayParameters DecayTimeCalculator::calculate(const std::vector<double>& curve_db, double fs,
                                               const DecayAnalysisConfig& config) {
    DecayParameters parameters;
    parameters.edt = decay_time(curve_db, fs, config.edt, config);
    parameters.t20 = decay_time(curve_db, fs, config.t20, config);
    parameters.t30 = decay_time(curve_db, fs, config.t30, config);
    return parameters;
}

double DecayTimeCalculator::decay_time(const std::vector<double>& curve_db, double fs, const DecayWindow& window,
                                       const DecayAnalysisConfig& config) {
    return fit_decay_time(select_window(curve_db, fs, window), window, config);
}

DecayTimeCalculator::FitWindow DecayTimeCalculator::select_window(const std::vector<double>& curve_db, double fs,
                                                                  const DecayWindow& window) {
    std::vector<double> time = time_axis(curve_db.size(), fs);

    // -inf is a silent sample and never the maximum; NaN has no place in a level series
    std::size_t max_index = curve_db.size();
    double max_db = -std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < curve_db.size(); ++i) {
        if (std::isnan(curve_db[i])) {
            throw NumericDomainError("Decay curve holds NaN at sample " + std::to_string(i));
        }
        if (curve_db[i] > max_db) {
            max_db = curve_db[i];
            max_index = i;
        }
    }
    if (max_index == curve_db.size() || std::isinf(max_db)) {
        throw DegenerateInputError("Decay curve has no finite maximum");
    }

    const double upper = max_db - window.lo_db;
    const double lower = max_db - window.hi_db;

    FitWindow points;
    for (std::size_t i = max_index; i < curve_db.size(); ++i) {
        if (curve_db[i] <= upper && curve_db[i] > lower) {
            points.time.push_back(time[i]);
            points.level_db.push_back(curve_db[i]);
        }
    }
    return points;
}

DecayParameters DecayTimeCalculator::from_energy(const std::vector<double>& energy, double fs, std::size_t t,
                                                 double C, double rms, const DecayAnalysisConfig& config) {
    std::vector<double> curve = SchroederIntegrator::integrate(energy, t, C, rms);

    // Once the noise-subtracted remainder reaches zero, the rest of the head
    // carries no decay energy: those samples are silent, not negative energy
    auto crossing = std::find_if(curve.begin(), curve.begin() + t, [](double value) { return value <= 0.0; });
    std::fill(crossing, curve.begin() + t, 0.0);

    return calculate(power_to_db(curve), fs, config);
}

double DecayTimeCalculator::fit_decay_time(const FitWindow& points, const DecayWindow& window,
                                           const DecayAnalysisConfig& config) {
    if (points.time.size() < 2) {
        throw InsufficientWindowError(window.name, std::to_string(points.time.size()) +
                                      " point(s) between -" + std::to_string(window.lo_db) +
                                      " and -" + std::to_string(window.hi_db) + " dB");
    }

    // The curve must reach far enough into the window for the slope to mean anything
    auto range = std::minmax_element(points.level_db.begin(), points.level_db.end());
    double span = *range.second - *range.first;
    double required = config.min_window_coverage * (window.hi_db - window.lo_db);
    if (span < required) {
        throw InsufficientWindowError(window.name, "decay spans " + std::to_string(span) +
                                      " dB, need " + std::to_string(required) + " dB");
    }

    auto regression = LeastSquaresFitter::fit(points.time, points.level_db);
    if (regression.slope >= 0.0) {
        throw InvalidSlopeError(window.name, regression.slope);
    }
    return -config.decay_range_db / regression.slope;
}
