#pragma once

#include <cmath>
#include <cstddef>
#include <numeric>
#include <utility>
#include <vector>
#include "PsePowerException.h"
#include "RngUtils.h"
#include "TrialRecord.h"

namespace psepower
{
  namespace simulation
  {
    /**
     * @brief Marks a fixed share of responses missing, completely at random.
     *
     * Exactly llround(p * N) distinct trials are chosen uniformly without
     * replacement (partial Fisher-Yates) and their response is cleared.
     * Covariates are never touched and selection ignores them.
     */
    class QualityDegrader
    {
    public:
      /**
       * @throws ConfigurationException if proportion is outside [0, 1].
       */
      explicit QualityDegrader(double proportion)
	: mProportion(proportion)
      {
	if (!(proportion >= 0.0 && proportion <= 1.0))
	  throw ConfigurationException("QualityDegrader: excluded proportion must lie in [0, 1]");
      }

      std::size_t missingCountFor(std::size_t numRecords) const
      {
	return static_cast<std::size_t>(std::llround(mProportion * static_cast<double>(numRecords)));
      }

      /**
       * @return Records with the selected responses set to missing.
       */
      template <class Rng>
      std::vector<TrialRecord> degrade(std::vector<TrialRecord> records, Rng& rng) const
      {
	const std::size_t n = records.size();
	const std::size_t k = missingCountFor(n);
	if (k == 0)
	  return records;

	std::vector<std::size_t> index(n);
	std::iota(index.begin(), index.end(), 0);

	for (std::size_t i = 0; i < k; ++i)
	  {
	    const std::size_t j = i + rng_utils::get_random_index(rng, n - i);
	    std::swap(index[i], index[j]);
	    records[index[i]].response.reset();
	  }

	return records;
      }

      double getProportion() const
      {
	return mProportion;
      }

    private:
      double mProportion;
    };
  } // namespace simulation
} // namespace psepower
