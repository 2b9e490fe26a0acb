/**
 * @file audio_processor.cpp
 * @brief Implementation of the shared element-wise signal utilities.
 */

#include "audio_processor.hpp"
#include "acoustics_errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

std::size_t AudioProcessor::peak_index(const std::vector<double>& signal) {
    if (signal.empty()) {
        throw DegenerateInputError("Signal is empty");
    }
    auto peak = std::max_element(signal.begin(), signal.end(),
        [](double a, double b) { return std::abs(a) < std::abs(b); });
    if (*peak == 0.0) {
        throw DegenerateInputError("Signal has zero maximum amplitude");
    }
    return static_cast<std::size_t>(std::distance(signal.begin(), peak));
}

std::vector<double> AudioProcessor::normalize_peak(const std::vector<double>& signal) {
    double max_value = std::abs(signal[peak_index(signal)]);
    std::vector<double> normalized(signal.size());
    std::transform(signal.begin(), signal.end(), normalized.begin(),
        [max_value](double value) { return value / max_value; });
    return normalized;
}

std::vector<double> AudioProcessor::square(const std::vector<double>& signal) {
    std::vector<double> power(signal.size());
    std::transform(signal.begin(), signal.end(), power.begin(),
        [](double value) { return value * value; });
    return power;
}

/**
 * @brief Convert energy to dB.
 *
 * @f$ \log_{10} 0 = -\infty @f$ is kept as the level of a silent sample, so a
 * fully decayed tail stays representable. Anything below zero means the caller
 * handed in something that is not an energy value.
 */
std::vector<double> AudioProcessor::power_to_db(const std::vector<double>& power) {
    std::vector<double> levels(power.size());
    for (std::size_t i = 0; i < power.size(); ++i) {
        double value = power[i];
        if (std::isnan(value) || value < 0.0) {
            throw NumericDomainError("Cannot take the level of energy value " +
                                     std::to_string(value) + " at sample " + std::to_string(i));
        }
        levels[i] = value == 0.0 ? -std::numeric_limits<double>::infinity()
                                 : 10.0 * std::log10(value);
    }
    return levels;
}

std::vector<double> AudioProcessor::time_axis(std::size_t length, double fs) {
    if (!(fs > 0.0)) {
        throw std::invalid_argument("Sample rate must be positive");
    }
    std::vector<double> time(length);
    for (std::size_t i = 0; i < length; ++i) {
        time[i] = static_cast<double>(i) / fs;
    }
    return time;
}

std::size_t AudioProcessor::tail_start(std::size_t length, double fraction) {
    if (!(fraction > 0.0 && fraction <= 1.0)) {
        throw std::invalid_argument("Noise segment fraction must lie in (0, 1], got " +
                                    std::to_string(fraction));
    }
    std::size_t tail = static_cast<std::size_t>(static_cast<double>(length) * fraction);
    return length - std::min(tail, length);
}

double AudioProcessor::noise_floor_db(const std::vector<double>& power, double fraction) {
    std::size_t start = tail_start(power.size(), fraction);
    if (start >= power.size()) {
        throw DegenerateInputError("Signal too short to hold a noise segment");
    }
    double noise_max = *std::max_element(power.begin() + start, power.end());
    return power_to_db({noise_max}).front();
}

double AudioProcessor::noise_power(const std::vector<double>& power, double fraction) {
    std::size_t start = tail_start(power.size(), fraction);
    if (start >= power.size()) {
        throw DegenerateInputError("Signal too short to hold a noise segment");
    }
    double noise_sum = std::accumulate(power.begin() + start, power.end(), 0.0);
    return noise_sum / static_cast<double>(power.size() - start);
}
