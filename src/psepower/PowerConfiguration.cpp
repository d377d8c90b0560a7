#include <limits>
#include "PowerConfiguration.h"
#include "PsePowerException.h"
#include "csv.h"

namespace psepower
{
  std::map<std::string, double> CoefficientFileReader::readTermMap() const
  {
    std::map<std::string, double> terms;

    try
      {
	io::CSVReader<2> csvCoefficientFile(mFileName.c_str());
	csvCoefficientFile.read_header(io::ignore_extra_column, "term", "estimate");

	std::string term;
	double estimate;
	while (csvCoefficientFile.read_row(term, estimate))
	  {
	    if (!terms.emplace(term, estimate).second)
	      throw ConfigurationException("CoefficientFileReader::readTermMap - term '" + term
					   + "' appears more than once in " + mFileName);
	  }
      }
    catch (const io::error::base& e)
      {
	throw ConfigurationException("CoefficientFileReader::readTermMap - " + std::string(e.what()));
      }

    if (terms.empty())
      throw ConfigurationException("CoefficientFileReader::readTermMap - no coefficients in " + mFileName);

    return terms;
  }

  simulation::FixedEffectSet CoefficientFileReader::readFixedEffectSet() const
  {
    return simulation::FixedEffectSet::fromTermMap(readTermMap());
  }

  double excludedProportionFromCounts(uint64_t retainedTrials, uint64_t totalTrials)
  {
    if (totalTrials == 0)
      throw ConfigurationException("total trial count must be positive");
    if (retainedTrials > totalTrials)
      throw ConfigurationException("retained trials (" + std::to_string(retainedTrials)
				   + ") exceed total trials (" + std::to_string(totalTrials) + ")");

    return 1.0 - static_cast<double>(retainedTrials) / static_cast<double>(totalTrials);
  }

  uint32_t countFromOption(const std::string& optionName, int64_t value, bool allowZero)
  {
    if (value < 0 || (value == 0 && !allowZero))
      throw ConfigurationException("--" + optionName + " must be "
				   + (allowZero ? "non-negative" : "positive")
				   + ", got " + std::to_string(value));
    if (value > static_cast<int64_t>(std::numeric_limits<uint32_t>::max()))
      throw ConfigurationException("--" + optionName + " is too large: " + std::to_string(value));

    return static_cast<uint32_t>(value);
  }
}
