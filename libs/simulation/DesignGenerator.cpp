#include "DesignGenerator.h"
#include "PsePowerException.h"

namespace psepower
{
  namespace simulation
  {
    DesignGenerator::DesignGenerator(uint32_t subjectCount,
				     uint32_t trialCount,
				     ContrastAssignment assignment)
      : mSubjectCount(subjectCount),
	mTrialCount(trialCount),
	mAssignment(assignment)
    {
      if (subjectCount == 0)
	throw ConfigurationException("DesignGenerator: number of subjects must be positive");
      if (trialCount == 0)
	throw ConfigurationException("DesignGenerator: number of replicate trials must be positive");
    }

    std::vector<ContrastLevel> DesignGenerator::contrastLevelsFor(uint32_t subjectId) const
    {
      if (mAssignment == ContrastAssignment::WithinSubject)
	return {ContrastLevel::Positive, ContrastLevel::Negative};

      return {subjectId % 2 == 1 ? ContrastLevel::Positive : ContrastLevel::Negative};
    }

    std::size_t DesignGenerator::trialsPerSubject() const
    {
      const std::size_t contrasts = mAssignment == ContrastAssignment::WithinSubject ? 2 : 1;
      return static_cast<std::size_t>(mTrialCount) * contrasts * 2
	* kSizeMagnitudes.size() * kSizeSigns.size();
    }

    std::vector<TrialRecord> DesignGenerator::generate() const
    {
      std::vector<TrialRecord> records;
      records.reserve(trialsPerSubject() * mSubjectCount);

      for (uint32_t subject = 1; subject <= mSubjectCount; ++subject)
	for (ContrastLevel contrast : contrastLevelsFor(subject))
	  for (bool color : {true, false})
	    for (uint32_t replicate = 1; replicate <= mTrialCount; ++replicate)
	      for (int magnitude : kSizeMagnitudes)
		for (int sign : kSizeSigns)
		  {
		    const int sizeDelta = magnitude * sign;
		    records.push_back(TrialRecord{subject,
						  replicate,
						  contrast,
						  color,
						  sizeDelta,
						  colorEffectCode(color),
						  contrastEffectCode(contrast),
						  sizeCovariate(sizeDelta),
						  std::nullopt});
		  }

      return records;
    }
  } // namespace simulation
} // namespace psepower
