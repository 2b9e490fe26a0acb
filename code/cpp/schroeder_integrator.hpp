#pragma once
#include "audio_processor.hpp"
#include <vector>

/**
 * @file schroeder_integrator.hpp
 * @brief Backward (Schroeder) integration of an energy signal.
 *
 * The energy remaining in the decay from sample @f$ n @f$ to the truncation
 * point @f$ t @f$ is the reverse cumulative sum of the squared IR. With the
 * optional compensation terms the normalized curve is
 *
 * \f[
 *   S(n) = \frac{ \sum_{k=n}^{t-1} (h^2(k) - r) + C }
 *               { \sum_{k=0}^{t-1} (h^2(k) - r) + C },
 * \f]
 *
 * where @f$ C @f$ is the energy lost past the truncation point (Lundeby) and
 * @f$ r @f$ a noise power removed from every sample (Chu). Both are supplied by
 * the caller; zero gives the plain Schroeder curve starting at 1.0 (0 dB).
 */
class SchroederIntegrator : public AudioProcessor {
public:
    /**
     * @brief Normalized Schroeder curve of the first @p t samples.
     *
     * Samples at and after @p t are appended unchanged, so the result has the
     * same length as @p energy.
     *
     * @param energy Energy signal (squared, normalized IR).
     * @param t      Truncation index, 0 <= t <= energy.size().
     * @param C      Additive compensation (energy units).
     * @param rms    Noise power subtracted from every sample before integration.
     * @return Decay curve in linear energy units.
     * @throws std::invalid_argument if @p t exceeds the signal length.
     * @throws DegenerateInputError if the normalization energy is not positive.
     */
    static std::vector<double> integrate(const std::vector<double>& energy, std::size_t t,
                                         double C = 0.0, double rms = 0.0);
};
