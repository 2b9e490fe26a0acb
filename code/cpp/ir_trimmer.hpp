#pragma once
#include "acoustics_config.hpp"
#include "audio_processor.hpp"
#include <vector>

/**
 * @file ir_trimmer.hpp
 * @brief Peak-relative trimming of an impulse response.
 *
 * Everything before the IR peak (direct-sound arrival), plus a short guard
 * offset, is removed so that only the decay tail reaches the energy analysis.
 */
class IRTrimmer : public AudioProcessor {
public:
    /**
     * @brief Slice @p signal from @c peak_index + @p offset to the end.
     *
     * @param signal Impulse-response samples (linear amplitude).
     * @param offset Guard samples skipped after the peak.
     * @return Decay tail; empty when the peak lies within @p offset samples of
     *         the end.
     * @throws DegenerateInputError if @p signal is empty or entirely zero.
     */
    static std::vector<double> trim(const std::vector<double>& signal,
                                    std::size_t offset = TRIM_OFFSET_SAMPLES);
};
