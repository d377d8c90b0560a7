#include "EffectSizeAnalyzer.h"
#include "RepeatedMeasuresAnova.h"
#include <array>
#include <map>
#include <optional>

namespace psepower
{
  namespace power
  {
    const char* const kSubjectEffect = "(Intercept)";
    const char* const kColorEffect = "color";
    const char* const kContrastEffect = "contrast";
    const char* const kColorContrastEffect = "color:contrast";

    const std::vector<std::string>& effectNames()
    {
      static const std::vector<std::string> names = {
	kSubjectEffect, kColorEffect, kContrastEffect, kColorContrastEffect
      };
      return names;
    }

    const EffectSizeRecord* EffectSizeAnalysis::find(const std::string& effectName) const
    {
      for (const auto& e : effects)
	if (e.effectName == effectName)
	  return &e;
      return nullptr;
    }

    namespace
    {
      // Color true is level 0 of the within factor, positive contrast level 0 of the other.
      std::size_t colorLevel(bool color)
      {
	return color ? 0 : 1;
      }

      std::size_t contrastLevel(ContrastLevel contrast)
      {
	return contrast == ContrastLevel::Positive ? 0 : 1;
      }

      EffectSizeRecord toRecord(const char* name, const statistics::AnovaRow& row)
      {
	return EffectSizeRecord{name,
				row.fStatistic,
				row.dfEffect,
				row.dfError,
				row.pValue,
				row.partialEtaSquared,
				statistics::cohensFFromPartialEtaSquared(row.partialEtaSquared)};
      }

      EffectSizeAnalysis toAnalysis(const statistics::TwoByTwoAnovaResult& anova,
				    std::size_t excluded)
      {
	EffectSizeAnalysis analysis;
	analysis.effects = {
	  toRecord(kSubjectEffect, anova.intercept),
	  toRecord(kColorEffect, anova.factorA),
	  toRecord(kContrastEffect, anova.factorB),
	  toRecord(kColorContrastEffect, anova.interaction)
	};
	analysis.completeSubjects = anova.subjects;
	analysis.excludedSubjects = excluded;
	return analysis;
      }

      struct SubjectCells
      {
	std::array<std::optional<double>, 4> pse;
	std::optional<ContrastLevel> contrast;   // between-subject group
      };
    }

    EffectSizeAnalysis EffectSizeAnalyzer::analyze(const std::vector<PseEstimate>& estimates) const
    {
      std::map<uint32_t, SubjectCells> subjects;
      for (const auto& e : estimates)
	{
	  SubjectCells& cells = subjects[e.subjectId];
	  cells.contrast = e.contrast;
	  if (e.isValid())
	    cells.pse[colorLevel(e.color) * 2 + contrastLevel(e.contrast)] = e.pse;
	}

      std::size_t excluded = 0;

      if (mAssignment == ContrastAssignment::WithinSubject)
	{
	  std::vector<std::array<double, 4>> complete;
	  for (const auto& entry : subjects)
	    {
	      const auto& pse = entry.second.pse;
	      if (!(pse[0] && pse[1] && pse[2] && pse[3]))
		{
		  ++excluded;
		  continue;
		}
	      complete.push_back({*pse[0], *pse[1], *pse[2], *pse[3]});
	    }

	  if (complete.size() < 2)
	    throw InsufficientDesignException(std::to_string(complete.size())
					      + " complete subject(s) after listwise exclusion of "
					      + std::to_string(excluded));

	  return toAnalysis(statistics::withinSubjectsAnova(complete), excluded);
	}

      std::vector<std::array<double, 2>> complete;
      std::vector<int> groups;
      for (const auto& entry : subjects)
	{
	  const SubjectCells& cells = entry.second;
	  const std::size_t b = contrastLevel(*cells.contrast);
	  const auto& colorTrue = cells.pse[colorLevel(true) * 2 + b];
	  const auto& colorFalse = cells.pse[colorLevel(false) * 2 + b];
	  if (!(colorTrue && colorFalse))
	    {
	      ++excluded;
	      continue;
	    }
	  complete.push_back({*colorTrue, *colorFalse});
	  groups.push_back(static_cast<int>(b));
	}

      if (complete.size() < 3)
	throw InsufficientDesignException(std::to_string(complete.size())
					  + " complete subject(s) after listwise exclusion of "
					  + std::to_string(excluded));

      return toAnalysis(statistics::mixedAnova(complete, groups), excluded);
    }
  } // namespace power
} // namespace psepower
