#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace psepower
{
  namespace simulation
  {
    enum class ContrastLevel
    {
      Positive,
      Negative
    };

    // How the contrast factor is assigned to subjects.
    enum class ContrastAssignment
    {
      WithinSubject,   // every subject sees both contrast levels
      BetweenSubject   // odd subjects positive, even subjects negative
    };

    inline const char* contrastLevelName(ContrastLevel level)
    {
      return level == ContrastLevel::Positive ? "positive" : "negative";
    }

    inline const char* contrastAssignmentName(ContrastAssignment assignment)
    {
      return assignment == ContrastAssignment::WithinSubject ? "within" : "between";
    }

    // Sum-to-zero effect codes: the two levels of each factor sit at +/- 0.5.
    constexpr double kEffectCodeHigh = 0.5;
    constexpr double kEffectCodeLow = -0.5;

    inline double colorEffectCode(bool color)
    {
      return color ? kEffectCodeHigh : kEffectCodeLow;
    }

    inline double contrastEffectCode(ContrastLevel contrast)
    {
      return contrast == ContrastLevel::Positive ? kEffectCodeHigh : kEffectCodeLow;
    }

    // size is the model-scale stimulus, size_delta / 10
    inline double sizeCovariate(int sizeDelta)
    {
      return static_cast<double>(sizeDelta) / 10.0;
    }

    /**
     * @brief One same/different judgement of the simulated experiment.
     *
     * Covariates are fixed at design time; only `response` changes
     * afterwards (simulated, then possibly marked missing).
     */
    struct TrialRecord
    {
      uint32_t subjectId;
      uint32_t replicate;
      ContrastLevel contrast;
      bool color;
      int sizeDelta;
      double colorE;
      double contrastE;
      double size;
      std::optional<int> response;   // 0, 1, or missing

      bool isMissing() const
      {
	return !response.has_value();
      }
    };

    inline bool operator==(const TrialRecord& lhs, const TrialRecord& rhs)
    {
      return lhs.subjectId == rhs.subjectId
	&& lhs.replicate == rhs.replicate
	&& lhs.contrast == rhs.contrast
	&& lhs.color == rhs.color
	&& lhs.sizeDelta == rhs.sizeDelta
	&& lhs.colorE == rhs.colorE
	&& lhs.contrastE == rhs.contrastE
	&& lhs.size == rhs.size
	&& lhs.response == rhs.response;
    }

    inline bool operator!=(const TrialRecord& lhs, const TrialRecord& rhs)
    {
      return !(lhs == rhs);
    }
  } // namespace simulation
} // namespace psepower
