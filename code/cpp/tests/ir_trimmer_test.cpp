// ==============================================================================
// Tests for peak-relative IR trimming
// ==============================================================================

#include <catch2/catch.hpp>

#include "acoustics_errors.hpp"
#include "ir_trimmer.hpp"

#include <vector>

namespace {

/// Ramp 0.01, 0.02, ... with a single spike of @p peak at @p index
std::vector<double> spikedSignal(size_t length, size_t index, double peak) {
    std::vector<double> signal(length);
    for (size_t i = 0; i < length; ++i) {
        signal[i] = 0.01 * static_cast<double>(i + 1);
    }
    signal[index] = peak;
    return signal;
}

} // anonymous namespace

TEST_CASE("IRTrimmer keeps the tail from peak + 5", "[trimmer]") {
    SECTION("positive peak") {
        std::vector<double> signal = spikedSignal(20, 3, 1.0);
        std::vector<double> trimmed = IRTrimmer::trim(signal);

        REQUIRE(trimmed.size() == 20 - 3 - 5);
        REQUIRE(trimmed == std::vector<double>(signal.begin() + 8, signal.end()));
    }

    SECTION("negative peak") {
        std::vector<double> signal = spikedSignal(50, 17, -4.0);
        std::vector<double> trimmed = IRTrimmer::trim(signal);

        REQUIRE(trimmed.size() == 50 - 17 - 5);
        REQUIRE(trimmed.front() == signal[22]);
        REQUIRE(trimmed.back() == signal.back());
    }

    SECTION("custom guard offset") {
        std::vector<double> signal = spikedSignal(20, 3, 1.0);
        REQUIRE(IRTrimmer::trim(signal, 0).front() == 1.0);
    }
}

TEST_CASE("IRTrimmer edge cases", "[trimmer][errors]") {
    SECTION("peak within the guard of the end leaves nothing") {
        REQUIRE(IRTrimmer::trim(spikedSignal(10, 6, 1.0)).empty());
        REQUIRE(IRTrimmer::trim(spikedSignal(10, 5, 1.0)).empty());
    }

    SECTION("empty and all-zero input are degenerate") {
        REQUIRE_THROWS_AS(IRTrimmer::trim({}), DegenerateInputError);
        REQUIRE_THROWS_AS(IRTrimmer::trim(std::vector<double>(64, 0.0)), DegenerateInputError);
    }
}
