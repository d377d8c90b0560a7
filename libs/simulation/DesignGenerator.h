#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>
#include "TrialRecord.h"

namespace psepower
{
  namespace simulation
  {
    /**
     * @brief Builds the trial-level skeleton of the experiment.
     *
     * Every subject crosses replicate x contrast x color x size magnitude
     * (0, 10, ..., 80) x sign (+, -), with size_delta = magnitude * sign.
     * Magnitude 0 under both signs yields two size_delta = 0 trials per
     * cell; these are kept, so zero carries twice the weight of any other
     * stimulus level.
     *
     * With ContrastAssignment::BetweenSubject the contrast factor is not
     * crossed: subject k sees only positive (k odd) or negative (k even).
     *
     * Responses are left missing; ResponseSimulator fills them.
     */
    class DesignGenerator
    {
    public:
      static constexpr std::array<int, 9> kSizeMagnitudes = {0, 10, 20, 30, 40, 50, 60, 70, 80};
      static constexpr std::array<int, 2> kSizeSigns = {1, -1};

      /**
       * @throws ConfigurationException if subjectCount or trialCount is zero.
       */
      DesignGenerator(uint32_t subjectCount,
		      uint32_t trialCount,
		      ContrastAssignment assignment = ContrastAssignment::WithinSubject);

      std::vector<TrialRecord> generate() const;

      // Trials produced for one subject.
      std::size_t trialsPerSubject() const;

      // Contrast levels subject `subjectId` (1-based) is exposed to.
      std::vector<ContrastLevel> contrastLevelsFor(uint32_t subjectId) const;

      uint32_t getSubjectCount() const { return mSubjectCount; }
      uint32_t getTrialCount() const { return mTrialCount; }
      ContrastAssignment getContrastAssignment() const { return mAssignment; }

    private:
      uint32_t mSubjectCount;
      uint32_t mTrialCount;
      ContrastAssignment mAssignment;
    };
  } // namespace simulation
} // namespace psepower
