#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <string>
#include "TrialRecord.h"

namespace psepower
{
  namespace simulation
  {
    /// Fixed-effect terms of the response model, in design-matrix column order.
    enum class ModelTerm
    {
      Intercept,
      ColorE,
      ContrastE,
      Size,
      ColorXContrast,
      ColorXSize,
      ContrastXSize,
      ColorXContrastXSize
    };

    constexpr std::size_t kNumModelTerms = 8;

    /**
     * @brief Maps a fixed-effect term to its column of the design matrix.
     *
     * `name` is the exact label the coefficient table must use;
     * `covariate` evaluates the column for one trial.
     */
    struct DesignTermDescriptor
    {
      ModelTerm term;
      const char* name;
      double (*covariate)(const TrialRecord&);
    };

    const std::array<DesignTermDescriptor, kNumModelTerms>& designMatrixDescriptor();

    const char* modelTermName(ModelTerm term);

    /// Label of the subject random-intercept standard deviation.
    extern const char* const kRandomInterceptSdTerm;

    /**
     * @brief Validated coefficient table of the pilot model.
     *
     * Holds one estimate per ModelTerm plus the random-intercept SD. Built
     * once from a name -> estimate mapping and passed by value afterwards.
     */
    class FixedEffectSet
    {
    public:
      /**
       * @throws ConfigurationException if a required term is missing, an
       *         unknown term is present, an estimate is not finite or the
       *         random-intercept SD is negative.
       */
      static FixedEffectSet fromTermMap(const std::map<std::string, double>& terms);

      double getCoefficient(ModelTerm term) const
      {
	return mCoefficients[static_cast<std::size_t>(term)];
      }

      double getRandomInterceptSd() const
      {
	return mRandomInterceptSd;
      }

      std::map<std::string, double> toTermMap() const;

    private:
      FixedEffectSet(const std::array<double, kNumModelTerms>& coefficients, double randomInterceptSd)
	: mCoefficients(coefficients),
	  mRandomInterceptSd(randomInterceptSd)
      {}

      std::array<double, kNumModelTerms> mCoefficients;
      double mRandomInterceptSd;
    };
  } // namespace simulation
} // namespace psepower
