// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include "FixedEffectSet.h"

namespace psepower
{
  /**
   * @brief Reads the pilot model's coefficient table.
   *
   * The file is a two-column CSV with header `term,estimate`, one row per
   * fixed effect plus the random-intercept SD row `sd__(Intercept)`.
   */
  class CoefficientFileReader
  {
  public:
    explicit CoefficientFileReader(const std::string& fileName)
      : mFileName(fileName)
    {}

    /**
     * @throws ConfigurationException if the file cannot be read, a row is
     *         malformed or a term appears twice.
     */
    std::map<std::string, double> readTermMap() const;

    /**
     * @throws ConfigurationException as readTermMap(), or if the term set
     *         does not match the response model.
     */
    simulation::FixedEffectSet readFixedEffectSet() const;

    const std::string& getFileName() const
    {
      return mFileName;
    }

  private:
    std::string mFileName;
  };

  /**
   * @brief Share of trials lost to the experiment's exclusion criteria,
   * 1 - retained / total.
   * @throws ConfigurationException unless 0 < total and retained <= total.
   */
  double excludedProportionFromCounts(uint64_t retainedTrials, uint64_t totalTrials);

  /**
   * @brief Narrows a count read from the command line as a signed value.
   * @throws ConfigurationException if the value is negative, zero when
   *         zero is not allowed, or larger than a uint32_t holds.
   */
  uint32_t countFromOption(const std::string& optionName, int64_t value, bool allowZero = false);
}
