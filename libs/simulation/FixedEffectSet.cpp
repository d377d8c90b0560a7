#include "FixedEffectSet.h"
#include "PsePowerException.h"
#include <cmath>
#include <sstream>

namespace psepower
{
  namespace simulation
  {
    const char* const kRandomInterceptSdTerm = "sd__(Intercept)";

    namespace
    {
      double interceptColumn(const TrialRecord&) { return 1.0; }
      double colorColumn(const TrialRecord& t) { return t.colorE; }
      double contrastColumn(const TrialRecord& t) { return t.contrastE; }
      double sizeColumn(const TrialRecord& t) { return t.size; }
      double colorContrastColumn(const TrialRecord& t) { return t.colorE * t.contrastE; }
      double colorSizeColumn(const TrialRecord& t) { return t.colorE * t.size; }
      double contrastSizeColumn(const TrialRecord& t) { return t.contrastE * t.size; }
      double colorContrastSizeColumn(const TrialRecord& t) { return t.colorE * t.contrastE * t.size; }
    }

    const std::array<DesignTermDescriptor, kNumModelTerms>& designMatrixDescriptor()
    {
      static const std::array<DesignTermDescriptor, kNumModelTerms> descriptor = {{
	  {ModelTerm::Intercept,           "(Intercept)",             &interceptColumn},
	  {ModelTerm::ColorE,              "color.e",                 &colorColumn},
	  {ModelTerm::ContrastE,           "contrast.e",              &contrastColumn},
	  {ModelTerm::Size,                "size",                    &sizeColumn},
	  {ModelTerm::ColorXContrast,      "color.e:contrast.e",      &colorContrastColumn},
	  {ModelTerm::ColorXSize,          "color.e:size",            &colorSizeColumn},
	  {ModelTerm::ContrastXSize,       "contrast.e:size",         &contrastSizeColumn},
	  {ModelTerm::ColorXContrastXSize, "color.e:contrast.e:size", &colorContrastSizeColumn}
	}};
      return descriptor;
    }

    const char* modelTermName(ModelTerm term)
    {
      return designMatrixDescriptor()[static_cast<std::size_t>(term)].name;
    }

    FixedEffectSet FixedEffectSet::fromTermMap(const std::map<std::string, double>& terms)
    {
      std::array<double, kNumModelTerms> coefficients{};
      std::ostringstream missing;

      for (const auto& column : designMatrixDescriptor())
	{
	  auto it = terms.find(column.name);
	  if (it == terms.end())
	    {
	      missing << " '" << column.name << "'";
	      continue;
	    }
	  if (!std::isfinite(it->second))
	    throw ConfigurationException(std::string("coefficient for '") + column.name + "' is not finite");
	  coefficients[static_cast<std::size_t>(column.term)] = it->second;
	}

      auto sdIt = terms.find(kRandomInterceptSdTerm);
      if (sdIt == terms.end())
	missing << " '" << kRandomInterceptSdTerm << "'";

      if (!missing.str().empty())
	throw ConfigurationException("fixed-effect set is missing required terms:" + missing.str());

      if (terms.size() != kNumModelTerms + 1)
	{
	  std::ostringstream unknown;
	  for (const auto& entry : terms)
	    {
	      bool known = entry.first == kRandomInterceptSdTerm;
	      for (const auto& column : designMatrixDescriptor())
		known = known || entry.first == column.name;
	      if (!known)
		unknown << " '" << entry.first << "'";
	    }
	  throw ConfigurationException("fixed-effect set has unknown terms:" + unknown.str());
	}

      const double sd = sdIt->second;
      if (!std::isfinite(sd) || sd < 0.0)
	throw ConfigurationException(std::string("'") + kRandomInterceptSdTerm
				     + "' must be a finite, non-negative standard deviation");

      return FixedEffectSet(coefficients, sd);
    }

    std::map<std::string, double> FixedEffectSet::toTermMap() const
    {
      std::map<std::string, double> terms;
      for (const auto& column : designMatrixDescriptor())
	terms[column.name] = getCoefficient(column.term);
      terms[kRandomInterceptSdTerm] = mRandomInterceptSd;
      return terms;
    }
  } // namespace simulation
} // namespace psepower
