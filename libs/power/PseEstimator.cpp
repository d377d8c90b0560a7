#include "PseEstimator.h"
#include <cmath>
#include <tuple>

namespace psepower
{
  namespace power
  {
    namespace
    {
      struct GroupData
      {
	std::vector<double> sizeDelta;
	std::vector<int> responses;
      };

      using GroupKey = std::tuple<uint32_t, bool, ContrastLevel>;
    }

    PseEstimator::PseEstimator(statistics::LogisticFitOptions options, double flatSlopeTolerance)
      : mOptions(options),
	mFlatSlopeTolerance(flatSlopeTolerance)
    {}

    std::vector<PseEstimate> PseEstimator::estimate(const std::vector<TrialRecord>& records) const
    {
      std::map<GroupKey, GroupData> groups;

      for (const auto& trial : records)
	{
	  // Create the group even if every trial is missing so it is reported invalid
	  GroupData& group = groups[GroupKey(trial.subjectId, trial.color, trial.contrast)];
	  if (trial.isMissing())
	    continue;

	  group.sizeDelta.push_back(static_cast<double>(trial.sizeDelta));
	  group.responses.push_back(*trial.response);
	}

      std::vector<PseEstimate> estimates;
      estimates.reserve(groups.size());
      for (const auto& entry : groups)
	estimates.push_back(estimateGroup(std::get<0>(entry.first),
					  std::get<1>(entry.first),
					  std::get<2>(entry.first),
					  entry.second.sizeDelta,
					  entry.second.responses));
      return estimates;
    }

    PseEstimate PseEstimator::estimateGroup(uint32_t subjectId,
					    bool color,
					    ContrastLevel contrast,
					    const std::vector<double>& sizeDelta,
					    const std::vector<int>& responses) const
    {
      PseEstimate result{subjectId, color, contrast, std::nullopt, FitFailure::None, responses.size()};

      statistics::LogisticFit fit;
      try
	{
	  fit = statistics::fitLogistic(sizeDelta, responses, mOptions);
	}
      catch (const DegenerateFitException& e)
	{
	  result.failure = e.getReason();
	  return result;
	}

      if (!fit.converged)
	{
	  result.failure = FitFailure::NonConvergence;
	  return result;
	}

      if (!(std::fabs(fit.slope) >= mFlatSlopeTolerance))
	{
	  result.failure = FitFailure::FlatSlope;
	  return result;
	}

      const double pse = -fit.intercept / fit.slope;
      if (!std::isfinite(pse))
	{
	  result.failure = FitFailure::NonFiniteEstimate;
	  return result;
	}

      result.pse = pse;
      return result;
    }

    std::map<FitFailure, std::size_t> PseEstimator::countFailures(const std::vector<PseEstimate>& estimates)
    {
      std::map<FitFailure, std::size_t> counts;
      for (const auto& e : estimates)
	if (!e.isValid())
	  ++counts[e.failure];
      return counts;
    }
  } // namespace power
} // namespace psepower
