#pragma once
#include <vector>

/**
 * @file least_squares_fitter.hpp
 * @brief Ordinary least-squares straight-line fit.
 *
 * Solves @f$ \min_{m,c} \sum_i (y_i - m x_i - c)^2 @f$ through a
 * column-pivoting Householder QR of the design matrix @f$ [x \; 1] @f$, so a
 * degenerate abscissa shows up as a rank deficiency instead of a division by a
 * vanishing determinant.
 */
class LeastSquaresFitter {
public:
    struct Result {
        double slope;
        double intercept;
        std::vector<double> fitted_line; ///< slope * x[i] + intercept
    };

    /**
     * @brief Fit @f$ y = m x + c @f$.
     *
     * @param x Abscissa (at least two distinct values).
     * @param y Ordinate, same length as @p x.
     * @return Slope, intercept and the line evaluated at @p x.
     * @throws std::invalid_argument if @p x and @p y differ in size.
     * @throws SingularFitError if fewer than two points are given or @p x has
     *         no spread.
     */
    static Result fit(const std::vector<double>& x, const std::vector<double>& y);
};
