#pragma once
#include "acoustics_config.hpp"
#include "audio_processor.hpp"
#include "decay_time_calculator.hpp"
#include <functional>
#include <vector>

/**
 * @file inr_calculator.hpp
 * @brief Impulse-to-noise ratio (INR) of a room impulse response.
 *
 * INR compares the level the decay would have at the arrival of the impulse
 * (LIR, extrapolated through T20) with the background noise level (LN):
 *
 * \f[
 *   S_0  = 10 \log_{10} \frac{T_{20}\, h_0^2}{6 \ln 10}, \qquad
 *   L_{IR} = S_0 + 10 \log_{10} \frac{6 \ln 10}{T_{20}}, \qquad
 *   INR  = L_{IR} - L_N.
 * \f]
 *
 * The pipeline is uncompensated (C = 0, no noise subtraction); callers that
 * want Lundeby/Chu corrections use DecayTimeCalculator::from_energy directly.
 */

/// Final output of the INR pipeline.
struct AcousticMetrics {
    double inr;            ///< Impulse-to-noise ratio (dB).
    double lir;            ///< Extrapolated impulse response level (dB).
    double ln;             ///< Background noise level (dB).
    DecayParameters decay; ///< EDT/T20/T30 computed on the way (s).
};

/// Series handed to an external plotting collaborator.
struct DecayPlot {
    std::vector<double> time;         ///< Seconds, aligned with both series.
    std::vector<double> raw_db;       ///< Normalized power of the trimmed IR.
    std::vector<double> schroeder_db; ///< Schroeder curve.
    double ln;
    double lir;
};

using DecayPlotHook = std::function<void(const DecayPlot&)>;

class INRCalculator : public AudioProcessor {
public:
    /**
     * @brief Compute INR, LIR and LN of an impulse response.
     *
     * @param signal    Impulse-response samples (linear amplitude).
     * @param fs        Sampling rate in Hz.
     * @param plot_hook Optional; receives the decay series once the metrics
     *                  are known.
     * @param config    Trim offset, noise segment and decay windows.
     * @return The metrics, including the intermediate decay parameters.
     * @throws DegenerateInputError, NumericDomainError, InsufficientWindowError,
     *         SingularFitError, InvalidSlopeError
     */
    static AcousticMetrics calculate(const std::vector<double>& signal, double fs,
                                     const DecayPlotHook& plot_hook = {},
                                     const DecayAnalysisConfig& config = {});
};
