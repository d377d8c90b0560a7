#include "PowerRunTypes.h"
#include "PsePowerException.h"

namespace psepower
{
  namespace power
  {
    void PowerRunSettings::validate() const
    {
      if (subjectCount == 0)
	throw ConfigurationException("number of subjects must be positive");
      if (trialCount == 0)
	throw ConfigurationException("number of replicate trials must be positive");
      if (replications == 0)
	throw ConfigurationException("number of replications must be positive");
      if (!(excludedProportion >= 0.0 && excludedProportion <= 1.0))
	throw ConfigurationException("excluded proportion must lie in [0, 1], got "
				     + std::to_string(excludedProportion));
      if (!(alpha > 0.0 && alpha < 1.0))
	throw ConfigurationException("alpha must lie in (0, 1), got " + std::to_string(alpha));

      const uint32_t minimumSubjects =
	contrastAssignment == ContrastAssignment::WithinSubject ? 2 : 3;
      if (subjectCount < minimumSubjects)
	throw ConfigurationException("a " + std::string(simulation::contrastAssignmentName(contrastAssignment))
				     + "-subject contrast design needs at least "
				     + std::to_string(minimumSubjects) + " subjects");
    }

    std::size_t ReplicationResult::invalidEstimates() const
    {
      std::size_t n = 0;
      for (const auto& e : estimates)
	if (!e.isValid())
	  ++n;
      return n;
    }

    PowerRunResult::PowerRunResult(double alpha)
      : mAlpha(alpha),
	mReplications(0),
	mAnalysed(0),
	mReplicationsWithInvalidPse(0),
	mInvalidPse(0),
	mExcludedSubjects(0)
    {
      for (const auto& name : effectNames())
	{
	  mCohensF[name];
	  mSummaries[name] = std::make_shared<statistics::EffectSizeAccumulator>(alpha);
	}
    }

    void PowerRunResult::addReplication(const ReplicationResult& replication)
    {
      ++mReplications;

      const std::size_t invalid = replication.invalidEstimates();
      mInvalidPse += invalid;
      if (invalid > 0)
	++mReplicationsWithInvalidPse;
      for (const auto& count : PseEstimator::countFailures(replication.estimates))
	mFailureCounts[count.first] += count.second;

      if (!replication.analysis)
	return;

      ++mAnalysed;
      mExcludedSubjects += replication.analysis->excludedSubjects;
      for (const auto& effect : replication.analysis->effects)
	{
	  mCohensF[effect.effectName].push_back(effect.cohensF);
	  auto& summary = mSummaries[effect.effectName];
	  if (!summary)
	    summary = std::make_shared<statistics::EffectSizeAccumulator>(mAlpha);
	  summary->addReplication(effect.cohensF, effect.pValue);
	}
    }

    const std::vector<double>& PowerRunResult::getCohensF(const std::string& effectName) const
    {
      static const std::vector<double> empty;
      auto it = mCohensF.find(effectName);
      return it == mCohensF.end() ? empty : it->second;
    }

    std::shared_ptr<const statistics::EffectSizeAccumulator>
    PowerRunResult::getSummary(const std::string& effectName) const
    {
      auto it = mSummaries.find(effectName);
      if (it == mSummaries.end())
	return nullptr;
      return it->second;
    }
  } // namespace power
} // namespace psepower
