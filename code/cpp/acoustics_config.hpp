#pragma once
#include <cstddef>
#include <string>

/**
 * @file acoustics_config.hpp
 * @brief Measurement constants for the decay-parameter pipeline.
 *
 * The defaults follow ISO 3382: EDT is fitted over the first 10 dB of decay,
 * T20 over -5..-25 dB and T30 over -5..-35 dB, all extrapolated to 60 dB.
 * ::DecayAnalysisConfig gathers them so a caller can tune them per standard
 * without touching the algorithms.
 */

// Analysis constants ----------------------------------------------------------

/// Samples skipped after the IR peak to clear residual pre-ringing.
constexpr std::size_t TRIM_OFFSET_SAMPLES = 5;

/// Trailing fraction of the energy signal assumed to be steady-state noise.
constexpr double NOISE_TAIL_FRACTION = 0.2;

/// Decay range (dB) a fitted slope is extrapolated to.
constexpr double DECAY_RANGE_DB = 60.0;

/// Minimum share of a window's dB width the selected points must span.
constexpr double MIN_WINDOW_COVERAGE = 0.5;

/**
 * @brief Half-open dB window below the curve maximum.
 *
 * A level @c v is selected when  max - hi_db < v <= max - lo_db.
 */
struct DecayWindow {
    std::string name; ///< Parameter the window estimates ("EDT", "T20", "T30").
    double lo_db;     ///< Upper edge, in dB below the maximum (inclusive).
    double hi_db;     ///< Lower edge, in dB below the maximum (exclusive).
};

const DecayWindow EDT_WINDOW{"EDT", 1.0, 10.0};
const DecayWindow T20_WINDOW{"T20", 5.0, 25.0};
const DecayWindow T30_WINDOW{"T30", 5.0, 35.0};

/// Tunable parameters of the decay analysis.
struct DecayAnalysisConfig {
    std::size_t trim_offset = TRIM_OFFSET_SAMPLES;
    double noise_tail_fraction = NOISE_TAIL_FRACTION;
    double decay_range_db = DECAY_RANGE_DB;
    double min_window_coverage = MIN_WINDOW_COVERAGE;
    DecayWindow edt = EDT_WINDOW;
    DecayWindow t20 = T20_WINDOW;
    DecayWindow t30 = T30_WINDOW;
};
