// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, December 2024
//

#ifndef __EFFECT_SIZE_ACCUMULATOR_H
#define __EFFECT_SIZE_ACCUMULATOR_H 1

#include <cmath>
#include <cstddef>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/min.hpp>
#include <boost/accumulators/statistics/max.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/median.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <boost/accumulators/statistics/count.hpp>

namespace psepower
{
  namespace statistics
  {
    /**
     * @class EffectSizeAccumulator
     * @brief Summary of one effect's Cohen's f across power-analysis replications.
     *
     * Wraps Boost.Accumulators behind a mutex so that replications finishing on
     * different threads may report into the same instance. Besides the moments
     * of Cohen's f it counts replications whose F test was significant at
     * alpha, which gives the empirical power of the design for that effect.
     *
     * The median is the P-square streaming estimate used by tag::median; it is
     * exact only for very small samples.
     */
    class EffectSizeAccumulator
    {
    private:
      using AccumulatorType = boost::accumulators::accumulator_set<
	double,
	boost::accumulators::stats<
	  boost::accumulators::tag::min,
	  boost::accumulators::tag::max,
	  boost::accumulators::tag::mean,
	  boost::accumulators::tag::median,
	  boost::accumulators::tag::variance,
	  boost::accumulators::tag::count
	  >
	>;

      mutable std::mutex m_mutex;
      AccumulatorType m_accumulator;
      double m_alpha;
      std::size_t m_significant;

    public:
      explicit EffectSizeAccumulator(double alpha = 0.05)
	: m_alpha(alpha),
	  m_significant(0)
      {
	if (!(alpha > 0.0 && alpha < 1.0))
	  throw std::invalid_argument("EffectSizeAccumulator: alpha must lie in (0, 1)");
      }

      /**
       * @brief Record one replication's effect size and p-value.
       */
      void addReplication(double cohensF, double pValue)
      {
	std::lock_guard<std::mutex> lock(m_mutex);
	m_accumulator(cohensF);
	if (pValue < m_alpha)
	  ++m_significant;
      }

      std::optional<double> getMean() const
      {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (boost::accumulators::count(m_accumulator) == 0) return std::nullopt;
	return boost::accumulators::mean(m_accumulator);
      }

      std::optional<double> getMedian() const
      {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (boost::accumulators::count(m_accumulator) == 0) return std::nullopt;
	return boost::accumulators::median(m_accumulator);
      }

      /**
       * @brief Sample standard deviation (n - 1 denominator).
       * @return nullopt if fewer than 2 replications were recorded.
       */
      std::optional<double> getStdDev() const
      {
	std::lock_guard<std::mutex> lock(m_mutex);
	const std::size_t n = boost::accumulators::count(m_accumulator);
	if (n < 2) return std::nullopt;
	const double popVar = boost::accumulators::variance(m_accumulator);
	return std::sqrt(popVar * static_cast<double>(n) / static_cast<double>(n - 1));
      }

      std::optional<double> getMin() const
      {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (boost::accumulators::count(m_accumulator) == 0) return std::nullopt;
	return boost::accumulators::min(m_accumulator);
      }

      std::optional<double> getMax() const
      {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (boost::accumulators::count(m_accumulator) == 0) return std::nullopt;
	return boost::accumulators::max(m_accumulator);
      }

      std::size_t getCount() const
      {
	std::lock_guard<std::mutex> lock(m_mutex);
	return boost::accumulators::count(m_accumulator);
      }

      std::size_t getSignificantCount() const
      {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_significant;
      }

      /// Proportion of replications with p < alpha; nullopt before any replication.
      std::optional<double> getEmpiricalPower() const
      {
	std::lock_guard<std::mutex> lock(m_mutex);
	const std::size_t n = boost::accumulators::count(m_accumulator);
	if (n == 0) return std::nullopt;
	return static_cast<double>(m_significant) / static_cast<double>(n);
      }

      double getAlpha() const
      {
	return m_alpha;
      }
    };
  } // namespace statistics
} // namespace psepower

#endif // __EFFECT_SIZE_ACCUMULATOR_H
