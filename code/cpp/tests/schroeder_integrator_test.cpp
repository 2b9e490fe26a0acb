// ==============================================================================
// Tests for Schroeder backward integration
// ==============================================================================

#include <catch2/catch.hpp>

#include "acoustics_errors.hpp"
#include "schroeder_integrator.hpp"

#include <vector>

TEST_CASE("Schroeder curve of constant energy", "[schroeder]") {
    const size_t n = 100;
    std::vector<double> energy(n, 0.37);
    std::vector<double> curve = SchroederIntegrator::integrate(energy, n);

    REQUIRE(curve.size() == n);
    REQUIRE(curve.front() == 1.0);
    for (size_t i = 0; i < n; ++i) {
        REQUIRE(curve[i] == Approx(static_cast<double>(n - i) / n));
    }
}

TEST_CASE("Schroeder curve keeps the signal length", "[schroeder][length]") {
    std::vector<double> energy{4.0, 3.0, 2.0, 1.0, 0.5, 0.25, 0.125};

    for (size_t t : {size_t{0}, size_t{1}, size_t{4}, energy.size()}) {
        REQUIRE(SchroederIntegrator::integrate(energy, t).size() == energy.size());
        REQUIRE(SchroederIntegrator::integrate(energy, t, 1.5).size() == energy.size());
        REQUIRE(SchroederIntegrator::integrate(energy, t, 0.3, 0.1).size() == energy.size());
    }
}

TEST_CASE("Schroeder truncation and compensation", "[schroeder][compensation]") {
    std::vector<double> energy{4.0, 3.0, 2.0, 1.0, 0.7, 0.9};

    SECTION("samples after the truncation point are untouched") {
        std::vector<double> curve = SchroederIntegrator::integrate(energy, 4);
        REQUIRE(curve[0] == Approx(1.0));
        REQUIRE(curve[1] == Approx(0.6));
        REQUIRE(curve[2] == Approx(0.3));
        REQUIRE(curve[3] == Approx(0.1));
        REQUIRE(curve[4] == 0.7);
        REQUIRE(curve[5] == 0.9);
    }

    SECTION("additive compensation C") {
        std::vector<double> curve = SchroederIntegrator::integrate(energy, 4, 2.0);
        REQUIRE(curve[0] == Approx(1.0));
        REQUIRE(curve[1] == Approx(8.0 / 12.0));
        REQUIRE(curve[2] == Approx(5.0 / 12.0));
        REQUIRE(curve[3] == Approx(3.0 / 12.0));
    }

    SECTION("noise power subtracted from every sample") {
        std::vector<double> curve = SchroederIntegrator::integrate(energy, 4, 0.0, 0.5);
        REQUIRE(curve[0] == Approx(1.0));
        REQUIRE(curve[1] == Approx(4.5 / 8.0));
        REQUIRE(curve[2] == Approx(2.0 / 8.0));
        REQUIRE(curve[3] == Approx(0.5 / 8.0));
    }

    SECTION("zero truncation leaves the signal as is") {
        REQUIRE(SchroederIntegrator::integrate(energy, 0) == energy);
    }
}

TEST_CASE("Schroeder invalid input", "[schroeder][errors]") {
    SECTION("truncation past the end") {
        REQUIRE_THROWS_AS(SchroederIntegrator::integrate({1.0, 0.5}, 3), std::invalid_argument);
    }

    SECTION("no energy to normalize by") {
        REQUIRE_THROWS_AS(SchroederIntegrator::integrate(std::vector<double>(16, 0.0), 16),
                          DegenerateInputError);
    }

    SECTION("noise power larger than the signal") {
        REQUIRE_THROWS_AS(SchroederIntegrator::integrate({0.2, 0.1, 0.05}, 3, 0.0, 1.0),
                          DegenerateInputError);
    }
}
