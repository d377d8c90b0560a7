#include "RepeatedMeasuresAnova.h"
#include "PsePowerException.h"
#include <boost/math/distributions/fisher_f.hpp>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

namespace psepower
{
  namespace statistics
  {
    namespace
    {
      // Builds a one-df row. Both sums of squares are already divided by the
      // squared norm of the contrast weights.
      AnovaRow makeRow(const char* effect, double ssEffect, double ssError, double dfError)
      {
	if (!(ssError > 0.0))
	  throw InsufficientDesignException(std::string(effect)
					    + ": zero residual variance in the error term");

	const double f = ssEffect / (ssError / dfError);
	return AnovaRow{ssEffect,
			ssError,
			1.0,
			dfError,
			f,
			fDistributionUpperTail(f, 1.0, dfError),
			partialEtaSquared(ssEffect, ssError)};
      }

      // Within-subject contrast: D_i = sum_k w_k y_ik tested against zero.
      AnovaRow contrastRow(const char* effect,
			   const std::vector<std::array<double, 4>>& cells,
			   const std::array<double, 4>& weights)
      {
	const double n = static_cast<double>(cells.size());
	const double norm = std::inner_product(weights.begin(), weights.end(), weights.begin(), 0.0);

	std::vector<double> scores;
	scores.reserve(cells.size());
	for (const auto& subject : cells)
	  scores.push_back(std::inner_product(weights.begin(), weights.end(), subject.begin(), 0.0));

	const double mean = std::accumulate(scores.begin(), scores.end(), 0.0) / n;
	double ssError = 0.0;
	for (double d : scores)
	  ssError += (d - mean) * (d - mean);

	return makeRow(effect, n * mean * mean / norm, ssError / norm, n - 1.0);
      }

      struct GroupedScores
      {
	std::array<double, 2> mean{0.0, 0.0};
	std::array<double, 2> count{0.0, 0.0};
	double ssWithinGroups = 0.0;
      };

      GroupedScores groupScores(const std::vector<double>& scores, const std::vector<int>& groups)
      {
	GroupedScores g;
	for (std::size_t i = 0; i < scores.size(); ++i)
	  {
	    g.mean[groups[i]] += scores[i];
	    g.count[groups[i]] += 1.0;
	  }
	for (int k = 0; k < 2; ++k)
	  g.mean[k] /= g.count[k];

	for (std::size_t i = 0; i < scores.size(); ++i)
	  {
	    const double d = scores[i] - g.mean[groups[i]];
	    g.ssWithinGroups += d * d;
	  }
	return g;
      }
    }

    double partialEtaSquared(double ssEffect, double ssError)
    {
      const double total = ssEffect + ssError;
      if (!(total > 0.0))
	return 0.0;
      return ssEffect / total;
    }

    double cohensFFromPartialEtaSquared(double pes)
    {
      if (pes >= 1.0)
	return std::numeric_limits<double>::infinity();
      if (pes <= 0.0)
	return 0.0;
      return std::sqrt(pes / (1.0 - pes));
    }

    double fDistributionUpperTail(double f, double df1, double df2)
    {
      if (!(f > 0.0))
	return 1.0;
      if (std::isinf(f))
	return 0.0;

      boost::math::fisher_f_distribution<double> dist(df1, df2);
      return boost::math::cdf(boost::math::complement(dist, f));
    }

    TwoByTwoAnovaResult withinSubjectsAnova(const std::vector<std::array<double, 4>>& cells)
    {
      if (cells.size() < 2)
	throw InsufficientDesignException("within-subjects ANOVA needs at least 2 complete subjects, got "
					  + std::to_string(cells.size()));

      TwoByTwoAnovaResult result{
	contrastRow("intercept", cells, {1.0, 1.0, 1.0, 1.0}),
	contrastRow("factor A", cells, {1.0, 1.0, -1.0, -1.0}),
	contrastRow("factor B", cells, {1.0, -1.0, 1.0, -1.0}),
	contrastRow("A x B", cells, {1.0, -1.0, -1.0, 1.0}),
	cells.size()};

      return result;
    }

    TwoByTwoAnovaResult mixedAnova(const std::vector<std::array<double, 2>>& cells,
				   const std::vector<int>& groups)
    {
      if (cells.size() != groups.size())
	throw std::invalid_argument("mixedAnova: cells and groups differ in length");

      std::array<std::size_t, 2> groupSizes{0, 0};
      for (int g : groups)
	{
	  if (g != 0 && g != 1)
	    throw std::invalid_argument("mixedAnova: group index must be 0 or 1");
	  ++groupSizes[g];
	}

      if (groupSizes[0] == 0 || groupSizes[1] == 0)
	throw InsufficientDesignException("mixed ANOVA needs subjects in both between-subject groups");
      if (cells.size() < 3)
	throw InsufficientDesignException("mixed ANOVA needs at least 3 complete subjects, got "
					  + std::to_string(cells.size()));

      // Subject stratum works on sums, within stratum on differences;
      // both contrasts have squared norm 2.
      std::vector<double> sums, diffs;
      sums.reserve(cells.size());
      diffs.reserve(cells.size());
      for (const auto& subject : cells)
	{
	  sums.push_back(subject[0] + subject[1]);
	  diffs.push_back(subject[0] - subject[1]);
	}

      const GroupedScores between = groupScores(sums, groups);
      const GroupedScores within = groupScores(diffs, groups);

      const double dfError = static_cast<double>(cells.size()) - 2.0;
      const double harmonic = 1.0 / between.count[0] + 1.0 / between.count[1];
      constexpr double norm = 2.0;

      const double sumsMarginal = 0.5 * (between.mean[0] + between.mean[1]);
      const double sumsContrast = between.mean[0] - between.mean[1];
      const double diffsMarginal = 0.5 * (within.mean[0] + within.mean[1]);
      const double diffsContrast = within.mean[0] - within.mean[1];

      const double ssBetweenError = between.ssWithinGroups / norm;
      const double ssWithinError = within.ssWithinGroups / norm;

      TwoByTwoAnovaResult result{
	makeRow("intercept", sumsMarginal * sumsMarginal / (0.25 * harmonic) / norm, ssBetweenError, dfError),
	makeRow("factor A", diffsMarginal * diffsMarginal / (0.25 * harmonic) / norm, ssWithinError, dfError),
	makeRow("factor B", sumsContrast * sumsContrast / harmonic / norm, ssBetweenError, dfError),
	makeRow("A x B", diffsContrast * diffsContrast / harmonic / norm, ssWithinError, dfError),
	cells.size()};

      return result;
    }
  } // namespace statistics
} // namespace psepower
