#pragma once
#include <cstddef>
#include <vector>

/**
 * @file audio_processor.hpp
 * @brief Element-wise signal utilities shared by the decay-analysis calculators.
 *
 * This header declares the ::AudioProcessor class, a static-utility container
 * the calculators derive from. It covers the small operations every stage of
 * the pipeline needs:
 *
 * - ::AudioProcessor::peak_index : first index of the maximum absolute sample.
 * - ::AudioProcessor::normalize_peak / ::AudioProcessor::square : amplitude to
 *   normalized energy.
 * - ::AudioProcessor::power_to_db : energy to decibels, with an explicit policy
 *   for zero and negative values.
 * - ::AudioProcessor::time_axis : sample index to seconds.
 * - ::AudioProcessor::noise_floor_db / ::AudioProcessor::noise_power : level of
 *   the trailing noise segment of an energy signal.
 *
 * Every function returns a new vector index-aligned with its input.
 */
class AudioProcessor {
public:
    /// Default constructor.
    AudioProcessor() = default;
    virtual ~AudioProcessor() = default;

    /**
     * @brief Index of the first sample with the largest absolute value.
     *
     * @param signal Samples (any units).
     * @return Peak index.
     * @throws DegenerateInputError if @p signal is empty or entirely zero.
     */
    static std::size_t peak_index(const std::vector<double>& signal);

    /**
     * @brief Divide every sample by the largest absolute sample.
     *
     * @throws DegenerateInputError if @p signal is empty or entirely zero.
     */
    static std::vector<double> normalize_peak(const std::vector<double>& signal);

    /// Square every sample (amplitude to energy).
    static std::vector<double> square(const std::vector<double>& signal);

    /**
     * @brief Convert energy values to decibels, @f$ 10 \log_{10} x @f$.
     *
     * Zero maps to -inf (a legitimate zero-energy sample). A negative value or
     * NaN has no level and is reported rather than turned into NaN.
     *
     * @param power Energy values (linear units, non-negative).
     * @return Levels in dB.
     * @throws NumericDomainError on a negative or NaN value.
     */
    static std::vector<double> power_to_db(const std::vector<double>& power);

    /**
     * @brief Time axis in seconds, @f$ t_i = i / f_s @f$.
     *
     * @throws std::invalid_argument if @p fs is not positive.
     */
    static std::vector<double> time_axis(std::size_t length, double fs);

    /**
     * @brief First index of the trailing @p fraction of a signal of @p length samples.
     *
     * @throws std::invalid_argument unless 0 < @p fraction <= 1.
     */
    static std::size_t tail_start(std::size_t length, double fraction);

    /**
     * @brief Noise level in dB: maximum of the trailing @p fraction of @p power.
     *
     * @throws DegenerateInputError if the trailing segment is empty.
     */
    static double noise_floor_db(const std::vector<double>& power, double fraction);

    /**
     * @brief Mean energy of the trailing @p fraction of @p power.
     *
     * Suitable as the @c rms term of a compensated Schroeder integration.
     *
     * @throws DegenerateInputError if the trailing segment is empty.
     */
    static double noise_power(const std::vector<double>& power, double fraction);
};
