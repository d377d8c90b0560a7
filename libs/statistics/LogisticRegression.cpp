#include "LogisticRegression.h"
#include "LinkFunctions.h"
#include "PsePowerException.h"
#include <algorithm>
#include <cfloat>
#include <cmath>
#include <stdexcept>

namespace psepower
{
  namespace statistics
  {
    namespace
    {
      constexpr double kMuEpsilon = DBL_EPSILON;

      double clampMean(double mu)
      {
	return std::min(std::max(mu, kMuEpsilon), 1.0 - kMuEpsilon);
      }

      double binomialDeviance(const std::vector<int>& y, const std::vector<double>& mu)
      {
	double dev = 0.0;
	for (std::size_t i = 0; i < y.size(); ++i)
	  dev -= 2.0 * (y[i] == 1 ? std::log(mu[i]) : std::log1p(-mu[i]));
	return dev;
      }
    }

    LogisticFit fitLogistic(const std::vector<double>& x,
			    const std::vector<int>& y,
			    const LogisticFitOptions& options)
    {
      if (x.size() != y.size())
	throw std::invalid_argument("fitLogistic: predictor and response lengths differ");

      std::size_t ones = 0;
      for (int v : y)
	{
	  if (v != 0 && v != 1)
	    throw std::invalid_argument("fitLogistic: responses must be 0 or 1");
	  ones += static_cast<std::size_t>(v);
	}

      const std::size_t n = y.size();
      if (ones == 0 || ones == n)
	throw DegenerateFitException(FitFailure::InsufficientResponseVariation,
				     "fitLogistic: need both outcomes, got "
				     + std::to_string(ones) + " of " + std::to_string(n));

      auto [minX, maxX] = std::minmax_element(x.begin(), x.end());
      if (*minX == *maxX)
	throw DegenerateFitException(FitFailure::FlatSlope,
				     "fitLogistic: predictor is constant");

      std::vector<double> mu(n), eta(n);
      for (std::size_t i = 0; i < n; ++i)
	{
	  mu[i] = (y[i] + 0.5) / 2.0;
	  eta[i] = logit(mu[i]);
	}

      double b0 = 0.0;
      double b1 = 0.0;
      double devOld = binomialDeviance(y, mu);
      double dev = devOld;
      bool converged = false;
      unsigned int iter = 0;

      while (iter < options.maxIterations)
	{
	  ++iter;

	  // Weighted least squares of the working response z on x.
	  double sw = 0.0, swx = 0.0, swxx = 0.0, swz = 0.0, swxz = 0.0;
	  for (std::size_t i = 0; i < n; ++i)
	    {
	      const double var = mu[i] * (1.0 - mu[i]);
	      const double z = eta[i] + (y[i] - mu[i]) / var;
	      sw += var;
	      swx += var * x[i];
	      swxx += var * x[i] * x[i];
	      swz += var * z;
	      swxz += var * x[i] * z;
	    }

	  const double det = sw * swxx - swx * swx;
	  if (!(det > 0.0) || !std::isfinite(det))
	    throw DegenerateFitException(FitFailure::NonConvergence,
					 "fitLogistic: singular weighted design at iteration "
					 + std::to_string(iter));

	  b1 = (sw * swxz - swx * swz) / det;
	  b0 = (swz - b1 * swx) / sw;

	  for (std::size_t i = 0; i < n; ++i)
	    {
	      eta[i] = b0 + b1 * x[i];
	      mu[i] = clampMean(logistic(eta[i]));
	    }

	  dev = binomialDeviance(y, mu);
	  if (!std::isfinite(dev))
	    break;

	  if (std::fabs(dev - devOld) / (std::fabs(dev) + 0.1) < options.convergenceTolerance)
	    {
	      converged = true;
	      break;
	    }
	  devOld = dev;
	}

      return LogisticFit{b0, b1, dev, iter, converged, n};
    }
  } // namespace statistics
} // namespace psepower
