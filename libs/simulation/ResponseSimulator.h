#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <vector>
#include "FixedEffectSet.h"
#include "LinkFunctions.h"
#include "RngUtils.h"
#include "TrialRecord.h"

namespace psepower
{
  namespace simulation
  {
    // One subject's random-intercept offset, constant across its trials.
    struct RandomEffectDraw
    {
      uint32_t subjectId;
      double intercept;
    };

    /**
     * @brief Samples binary responses from the fitted GLMM.
     *
     * Y = sum_k beta_k * x_k(trial) + u_subject over the columns of
     * designMatrixDescriptor(), p = logistic(Y), response ~ Bernoulli(p),
     * with u_subject ~ N(0, sd__(Intercept)).
     */
    class ResponseSimulator
    {
    public:
      explicit ResponseSimulator(FixedEffectSet fixedEffects)
	: mFixedEffects(fixedEffects)
      {}

      double linearPredictor(const TrialRecord& trial, double subjectIntercept) const
      {
	double eta = subjectIntercept;
	for (const auto& column : designMatrixDescriptor())
	  eta += mFixedEffects.getCoefficient(column.term) * column.covariate(trial);
	return eta;
      }

      double responseProbability(const TrialRecord& trial, double subjectIntercept) const
      {
	return statistics::logistic(linearPredictor(trial, subjectIntercept));
      }

      template <class Rng>
      int simulate(const TrialRecord& trial, double subjectIntercept, Rng& rng) const
      {
	return rng_utils::bernoulli(rng, responseProbability(trial, subjectIntercept)) ? 1 : 0;
      }

      /**
       * @brief One intercept per distinct subject, drawn in order of the
       * subject's first trial.
       */
      template <class Rng>
      std::vector<RandomEffectDraw> drawSubjectIntercepts(const std::vector<TrialRecord>& records,
							  Rng& rng) const
      {
	std::vector<RandomEffectDraw> draws;
	std::set<uint32_t> seen;
	for (const auto& trial : records)
	  {
	    if (!seen.insert(trial.subjectId).second)
	      continue;
	    draws.push_back(RandomEffectDraw{trial.subjectId,
					     rng_utils::draw_normal(rng, 0.0, mFixedEffects.getRandomInterceptSd())});
	  }
	return draws;
      }

      /**
       * @brief Draws subject intercepts, then fills every trial's response.
       * @return The intercepts used, for diagnostics.
       */
      template <class Rng>
      std::vector<RandomEffectDraw> simulate(std::vector<TrialRecord>& records, Rng& rng) const
      {
	std::vector<RandomEffectDraw> draws = drawSubjectIntercepts(records, rng);

	std::map<uint32_t, double> intercepts;
	for (const auto& d : draws)
	  intercepts[d.subjectId] = d.intercept;

	for (auto& trial : records)
	  trial.response = simulate(trial, intercepts.at(trial.subjectId), rng);

	return draws;
      }

      const FixedEffectSet& getFixedEffects() const
      {
	return mFixedEffects;
      }

    private:
      FixedEffectSet mFixedEffects;
    };
  } // namespace simulation
} // namespace psepower
