// ==============================================================================
// Tests for the least-squares line fit
// ==============================================================================

#include <catch2/catch.hpp>

#include "acoustics_errors.hpp"
#include "least_squares_fitter.hpp"

#include <vector>

TEST_CASE("LeastSquaresFitter recovers an exact line", "[fit]") {
    SECTION("two points") {
        auto result = LeastSquaresFitter::fit({0.0, 1.0}, {2.0, 5.0});
        REQUIRE(result.slope == Approx(3.0).margin(1e-9));
        REQUIRE(result.intercept == Approx(2.0).margin(1e-9));
    }

    SECTION("many collinear points") {
        std::vector<double> x, y;
        for (int i = -10; i <= 25; ++i) {
            x.push_back(0.1 * i);
            y.push_back(3.0 * 0.1 * i + 2.0);
        }
        auto result = LeastSquaresFitter::fit(x, y);

        REQUIRE(result.slope == Approx(3.0).margin(1e-9));
        REQUIRE(result.intercept == Approx(2.0).margin(1e-9));
        REQUIRE(result.fitted_line.size() == x.size());
        for (size_t i = 0; i < x.size(); ++i) {
            REQUIRE(result.fitted_line[i] == Approx(y[i]).margin(1e-9));
        }
    }

    SECTION("abscissa far from the origin") {
        std::vector<double> x{1000.0, 1000.001, 1000.002, 1000.003};
        std::vector<double> y;
        for (double xi : x) {
            y.push_back(-12.0 * xi + 7.0);
        }
        auto result = LeastSquaresFitter::fit(x, y);
        REQUIRE(result.slope == Approx(-12.0).epsilon(1e-6));
    }
}

TEST_CASE("LeastSquaresFitter minimizes the residual", "[fit]") {
    auto result = LeastSquaresFitter::fit({0.0, 1.0, 2.0, 3.0}, {1.0, 3.0, 2.0, 4.0});

    REQUIRE(result.slope == Approx(0.8));
    REQUIRE(result.intercept == Approx(1.3));
    REQUIRE(result.fitted_line[0] == Approx(1.3));
    REQUIRE(result.fitted_line[3] == Approx(3.7));
}

TEST_CASE("LeastSquaresFitter rejects ill-posed input", "[fit][errors]") {
    SECTION("mismatched sizes") {
        REQUIRE_THROWS_AS(LeastSquaresFitter::fit({0.0, 1.0}, {1.0}), std::invalid_argument);
    }

    SECTION("fewer than two points") {
        REQUIRE_THROWS_AS(LeastSquaresFitter::fit({}, {}), SingularFitError);
        REQUIRE_THROWS_AS(LeastSquaresFitter::fit({0.5}, {1.0}), SingularFitError);
    }

    SECTION("vertical line") {
        REQUIRE_THROWS_AS(LeastSquaresFitter::fit({0.3, 0.3, 0.3}, {1.0, 2.0, 3.0}), SingularFitError);
        REQUIRE_THROWS_AS(LeastSquaresFitter::fit({0.0, 0.0}, {1.0, 2.0}), SingularFitError);
    }
}
