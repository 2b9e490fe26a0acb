#include "least_squares_fitter.hpp"
#include "acoustics_errors.hpp"
#include <Eigen/Dense>
#include <stdexcept>
#include <string>

namespace {

// Pivots below this fraction of the largest one count as zero
constexpr double RANK_THRESHOLD = 1e-12;

} // namespace

LeastSquaresFitter::Result LeastSquaresFitter::fit(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size()) {
        throw std::invalid_argument("x and y must have the same size");
    }
    if (x.size() < 2) {
        throw SingularFitError("Need at least two points, got " + std::to_string(x.size()));
    }

    const Eigen::Index n = static_cast<Eigen::Index>(x.size());
    Eigen::Map<const Eigen::VectorXd> xv(x.data(), n);
    Eigen::Map<const Eigen::VectorXd> yv(y.data(), n);

    // Centre the abscissa: keeps the two columns well conditioned for time
    // axes far from zero, and turns a constant x into an exact zero column.
    const double x_mean = xv.mean();
    Eigen::MatrixXd design(n, 2);
    design.col(0) = xv.array() - x_mean;
    design.col(1).setOnes();

    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(design);
    qr.setThreshold(RANK_THRESHOLD);
    if (qr.rank() < 2) {
        throw SingularFitError("Abscissa has zero variance");
    }
    const Eigen::Vector2d coefficients = qr.solve(yv);

    const double slope = coefficients(0);
    const double intercept = coefficients(1) - slope * x_mean;

    std::vector<double> fitted_line(x.size());
    for (std::size_t i = 0; i < x.size(); ++i) {
        fitted_line[i] = slope * x[i] + intercept;
    }

    return {slope, intercept, fitted_line};
}
