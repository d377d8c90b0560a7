#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>
#include "LogisticRegression.h"
#include "PsePowerException.h"
#include "TrialRecord.h"

namespace psepower
{
  namespace power
  {
    using simulation::ContrastLevel;
    using simulation::TrialRecord;

    /**
     * @brief Point of subjective equality for one (subject, color, contrast)
     * group of a replication.
     *
     * `pse` is empty when the group's fit failed; `failure` then says why.
     */
    struct PseEstimate
    {
      uint32_t subjectId;
      bool color;
      ContrastLevel contrast;
      std::optional<double> pse;
      FitFailure failure;
      std::size_t observations;   // non-missing trials used by the fit

      bool isValid() const
      {
	return pse.has_value();
      }
    };

    /**
     * @class PseEstimator
     * @brief Fits one logistic psychometric function per (subject, color,
     * contrast) group and inverts it at p = 0.5.
     *
     * Each group's non-missing responses are regressed on raw size_delta;
     * pse = -b0 / b1. A group is marked invalid (never dropped silently) when
     * its responses do not contain both outcomes, the fit does not converge,
     * |b1| is below the flat-slope tolerance, or the ratio is not finite.
     */
    class PseEstimator
    {
    public:
      static constexpr double kDefaultFlatSlopeTolerance = 1e-10;

      explicit PseEstimator(statistics::LogisticFitOptions options = statistics::LogisticFitOptions(),
			    double flatSlopeTolerance = kDefaultFlatSlopeTolerance);

      /**
       * @return One estimate per group present in `records`, ordered by
       *         subject, then color (false first), then contrast.
       */
      std::vector<PseEstimate> estimate(const std::vector<TrialRecord>& records) const;

      /**
       * @brief Estimates a single group from its stimulus values and
       * responses (equal lengths, missing trials already removed).
       */
      PseEstimate estimateGroup(uint32_t subjectId,
				bool color,
				ContrastLevel contrast,
				const std::vector<double>& sizeDelta,
				const std::vector<int>& responses) const;

      // Number of invalid estimates per failure reason.
      static std::map<FitFailure, std::size_t> countFailures(const std::vector<PseEstimate>& estimates);

    private:
      statistics::LogisticFitOptions mOptions;
      double mFlatSlopeTolerance;
    };
  } // namespace power
} // namespace psepower
