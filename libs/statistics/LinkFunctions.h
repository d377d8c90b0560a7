#pragma once

#include <cmath>
#include <string>
#include "PsePowerException.h"

namespace psepower
{
  namespace statistics
  {
    /**
     * @brief Inverse logit link: maps a linear predictor to a probability.
     *
     * Evaluated in the branch that never exponentiates a large positive
     * number, so the result is finite for every finite eta and lies in [0, 1].
     *
     * @param eta Linear predictor on the log-odds scale.
     * @return 1 / (1 + exp(-eta))
     */
    inline double logistic(double eta) noexcept
    {
      if (eta >= 0.0)
	return 1.0 / (1.0 + std::exp(-eta));

      const double e = std::exp(eta);
      return e / (1.0 + e);
    }

    /**
     * @brief Logit link, the exact inverse of logistic() on (0, 1).
     *
     * @param p Probability strictly between 0 and 1.
     * @return log(p / (1 - p))
     * @throws NumericDomainException if p <= 0, p >= 1 or p is NaN.
     */
    inline double logit(double p)
    {
      if (!(p > 0.0 && p < 1.0))
	throw NumericDomainException("logit: probability must lie in (0, 1), got "
				     + std::to_string(p));

      return std::log(p) - std::log1p(-p);
    }
  } // namespace statistics
} // namespace psepower
