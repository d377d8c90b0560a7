#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "EffectSizeAccumulator.h"
#include "EffectSizeAnalyzer.h"
#include "PseEstimator.h"
#include "TrialRecord.h"

namespace psepower
{
  namespace power
  {
    /**
     * @brief Design and run parameters shared by every replication.
     */
    struct PowerRunSettings
    {
      uint32_t subjectCount = 0;
      uint32_t trialCount = 0;
      double excludedProportion = 0.0;
      uint32_t replications = 0;
      uint64_t seed = 0;
      ContrastAssignment contrastAssignment = ContrastAssignment::WithinSubject;
      double alpha = 0.05;

      /**
       * @throws ConfigurationException on zero counts, a proportion outside
       *         [0, 1], alpha outside (0, 1), or fewer subjects than the
       *         ANOVA needs (2 within, 3 between).
       */
      void validate() const;
    };

    /**
     * @brief Outcome of one replication. `analysis` is empty when the PSEs
     * that survived could not be analysed; `failureMessage` then says why.
     */
    struct ReplicationResult
    {
      std::size_t replication = 0;
      std::vector<PseEstimate> estimates;
      std::optional<EffectSizeAnalysis> analysis;
      std::string failureMessage;

      std::size_t invalidEstimates() const;
    };

    /**
     * @class PowerRunResult
     * @brief Effect-size distribution accumulated over a power run.
     *
     * Keeps the Cohen's f sequence of every effect (in replication order)
     * next to a summary accumulator per effect, plus the diagnostic counts
     * of invalid PSE groups and excluded subjects.
     */
    class PowerRunResult
    {
    public:
      explicit PowerRunResult(double alpha = 0.05);

      void addReplication(const ReplicationResult& replication);

      const std::map<std::string, std::vector<double>>& getCohensF() const
      {
	return mCohensF;
      }

      // Empty sequence for an effect never analysed.
      const std::vector<double>& getCohensF(const std::string& effectName) const;

      std::shared_ptr<const statistics::EffectSizeAccumulator> getSummary(const std::string& effectName) const;

      std::size_t getReplicationCount() const { return mReplications; }
      std::size_t getAnalysedReplications() const { return mAnalysed; }
      std::size_t getUnanalysableReplications() const { return mReplications - mAnalysed; }
      std::size_t getReplicationsWithInvalidPse() const { return mReplicationsWithInvalidPse; }
      std::size_t getInvalidPseCount() const { return mInvalidPse; }
      std::size_t getExcludedSubjectCount() const { return mExcludedSubjects; }
      double getAlpha() const { return mAlpha; }

      const std::map<FitFailure, std::size_t>& getFailureCounts() const
      {
	return mFailureCounts;
      }

    private:
      double mAlpha;
      std::map<std::string, std::vector<double>> mCohensF;
      std::map<std::string, std::shared_ptr<statistics::EffectSizeAccumulator>> mSummaries;
      std::map<FitFailure, std::size_t> mFailureCounts;
      std::size_t mReplications;
      std::size_t mAnalysed;
      std::size_t mReplicationsWithInvalidPse;
      std::size_t mInvalidPse;
      std::size_t mExcludedSubjects;
    };
  } // namespace power
} // namespace psepower
