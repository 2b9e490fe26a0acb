#pragma once
#include "acoustics_config.hpp"
#include "audio_processor.hpp"
#include "least_squares_fitter.hpp"
#include <vector>

/**
 * @file decay_time_calculator.hpp
 * @brief EDT, T20 and T30 from a decay curve in dB.
 *
 * Each parameter is the slope of a regression line over a fixed dB range of
 * the curve, below its maximum, extrapolated to a 60 dB decay:
 *
 * \f[
 *   T = -\frac{60}{m}, \qquad m \text{ in dB/s}.
 * \f]
 *
 * The windows follow ::DecayAnalysisConfig (ISO 3382 by default). A window
 * that cannot be fitted or that yields a non-decaying slope raises an error
 * naming the window; no default value is ever substituted.
 */

/// Reverberation-time estimates, in seconds.
struct DecayParameters {
    double edt;
    double t20;
    double t30;
};

class DecayTimeCalculator : public AudioProcessor {
public:
    /// Time/level pairs of a decay curve falling inside one dB window.
    struct FitWindow {
        std::vector<double> time;     ///< Seconds.
        std::vector<double> level_db; ///< Curve level in dB.
    };

    /**
     * @brief Compute EDT, T20 and T30 from a decay curve.
     *
     * Windows are evaluated in that order; the first failure propagates.
     *
     * @param curve_db Decay curve in dB (non-increasing over most of its range).
     * @param fs       Sampling rate in Hz.
     * @param config   Window definitions and extrapolation range.
     * @throws DegenerateInputError, NumericDomainError, InsufficientWindowError,
     *         SingularFitError, InvalidSlopeError
     */
    static DecayParameters calculate(const std::vector<double>& curve_db, double fs,
                                     const DecayAnalysisConfig& config = {});

    /**
     * @brief Decay time (seconds) for a single window.
     *
     * Lets a caller find out which parameters are usable when @c calculate
     * fails on one of them.
     */
    static double decay_time(const std::vector<double>& curve_db, double fs, const DecayWindow& window,
                             const DecayAnalysisConfig& config = {});

    /**
     * @brief Points of @p curve_db (from its maximum on) inside @p window.
     *
     * The time axis starts at the first sample of @p curve_db, so times keep
     * their position in the original curve.
     *
     * @throws DegenerateInputError if the curve has no finite maximum.
     * @throws NumericDomainError if the curve contains NaN.
     */
    static FitWindow select_window(const std::vector<double>& curve_db, double fs, const DecayWindow& window);

    /**
     * @brief Full analysis of an energy signal with caller-supplied compensation.
     *
     * Runs the Schroeder integration over @p energy truncated at @p t with
     * compensation @p C and noise power @p rms, converts to dB and evaluates
     * all windows. With noise subtraction the head of the curve falls to zero
     * or below near @p t; from the first such sample up to @p t the curve is
     * treated as silent (-inf dB).
     */
    static DecayParameters from_energy(const std::vector<double>& energy, double fs, std::size_t t,
                                       double C = 0.0, double rms = 0.0,
                                       const DecayAnalysisConfig& config = {});

private:
    static double fit_decay_time(const FitWindow& points, const DecayWindow& window,
                                 const DecayAnalysisConfig& config);
};
