#ifndef LANDCALC_FIXED_POINT_HPP
#define LANDCALC_FIXED_POINT_HPP

#include <cmath>

namespace landcalc {

struct FixedPointOptions {
    double tolerance;       // Absolute change that counts as converged
    int max_iterations;

    FixedPointOptions() : tolerance(1.0), max_iterations(15) {}
    FixedPointOptions(double tol, int max_iter) : tolerance(tol), max_iterations(max_iter) {}
};

struct FixedPointResult {
    double value;
    int iterations;
    bool converged;
};

/**
 * @brief Iterate x_{n+1} = step(x_n) until successive values differ by less than the tolerance
 *
 * Used to size a construction loan's interest reserve: the reserve feeds the
 * commitment, the commitment feeds the interest schedule, and the interest
 * schedule feeds the reserve.
 *
 * @param step Maps the current estimate to the next one
 * @param initial Starting estimate
 * @param options Tolerance and iteration cap
 * @return Last estimate; converged is false when the cap was reached first
 */
template <typename Step>
FixedPointResult solve_fixed_point(Step&& step, double initial,
                                   const FixedPointOptions& options = FixedPointOptions()) {
    double current = initial;
    int iterations = 0;
    for (int i = 0; i < options.max_iterations; ++i) {
        iterations = i + 1;
        double next = step(current);
        if (std::abs(next - current) < options.tolerance) {
            return {next, iterations, true};
        }
        current = next;
    }
    return {current, iterations, false};
}

} // namespace landcalc

#endif // LANDCALC_FIXED_POINT_HPP
