#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "PseEstimator.h"
#include "TrialRecord.h"

namespace psepower
{
  namespace power
  {
    using simulation::ContrastAssignment;

    // Effect names of the analysis table, in reporting order.
    extern const char* const kSubjectEffect;        // "(Intercept)"
    extern const char* const kColorEffect;          // "color"
    extern const char* const kContrastEffect;       // "contrast"
    extern const char* const kColorContrastEffect;  // "color:contrast"

    const std::vector<std::string>& effectNames();

    struct EffectSizeRecord
    {
      std::string effectName;
      double statistic;            // F
      double dfEffect;
      double dfError;
      double pValue;
      double partialEtaSquared;
      double cohensF;
    };

    struct EffectSizeAnalysis
    {
      std::vector<EffectSizeRecord> effects;
      std::size_t completeSubjects;
      std::size_t excludedSubjects;   // removed listwise for a missing cell

      // nullptr when no row carries that name
      const EffectSizeRecord* find(const std::string& effectName) const;
    };

    /**
     * @class EffectSizeAnalyzer
     * @brief Repeated-measures ANOVA of one replication's PSEs.
     *
     * Subjects lacking a valid PSE in any of their cells are excluded
     * listwise and counted. Color is always within subjects. Contrast is
     * within subjects for ContrastAssignment::WithinSubject (2 x 2 RM
     * ANOVA) and between subjects otherwise (mixed ANOVA). Each effect's
     * partial eta squared is converted to Cohen's f.
     */
    class EffectSizeAnalyzer
    {
    public:
      explicit EffectSizeAnalyzer(ContrastAssignment assignment = ContrastAssignment::WithinSubject)
	: mAssignment(assignment)
      {}

      /**
       * @throws InsufficientDesignException if too few complete subjects
       *         remain, a contrast group is empty, or an effect has no
       *         residual variance.
       */
      EffectSizeAnalysis analyze(const std::vector<PseEstimate>& estimates) const;

      ContrastAssignment getContrastAssignment() const
      {
	return mAssignment;
      }

    private:
      ContrastAssignment mAssignment;
    };
  } // namespace power
} // namespace psepower
