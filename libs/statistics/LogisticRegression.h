#pragma once

#include <cstddef>
#include <vector>

namespace psepower
{
  namespace statistics
  {
    struct LogisticFitOptions
    {
      unsigned int maxIterations = 25;
      double convergenceTolerance = 1e-8;  // relative deviance change
    };

    struct LogisticFit
    {
      double intercept;
      double slope;
      double deviance;
      unsigned int iterations;
      bool converged;
      std::size_t observations;
    };

    /**
     * @brief Maximum-likelihood fit of P(y = 1 | x) = logistic(b0 + b1 * x).
     *
     * Iteratively reweighted least squares started from mu = (y + 0.5) / 2.
     * Fitted means are clamped to [DBL_EPSILON, 1 - DBL_EPSILON] so that
     * separated data keeps finite weights. Iteration stops once
     * |dev - dev_old| / (|dev| + 0.1) falls below the tolerance.
     *
     * @param x Predictor values.
     * @param y Binary outcomes, each 0 or 1.
     * @return Fit with converged == false when maxIterations is exhausted.
     *
     * @throws std::invalid_argument if x and y differ in length or y holds a
     *         value other than 0 or 1.
     * @throws DegenerateFitException (InsufficientResponseVariation) if y does
     *         not contain both outcomes, or (FlatSlope) if x is constant.
     */
    LogisticFit fitLogistic(const std::vector<double>& x,
			    const std::vector<int>& y,
			    const LogisticFitOptions& options = LogisticFitOptions());
  } // namespace statistics
} // namespace psepower
