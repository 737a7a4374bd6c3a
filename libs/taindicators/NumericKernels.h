// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAINDICATORS_NUMERIC_KERNELS_H
#define __TAINDICATORS_NUMERIC_KERNELS_H 1

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include "Series.h"

//
// Rolling window kernels used to build the indicator compute functions.
//
// Every kernel returns a series of the same length as its input. Windows are
// trailing (the window for row i ends at row i) so there is no look-ahead. A
// kernel with window w leaves rows 0..w-2 missing, and any window that
// contains a missing input value produces a missing output.
//
namespace taindicators
{
  namespace detail
  {
    inline void checkPeriod(std::size_t period, const char *kernelName)
    {
      if (period == 0)
	throw std::domain_error(std::string(kernelName) + ": period must be greater than zero");
    }

    template <class Decimal>
    void checkAligned(const std::vector<Decimal>& series1,
		      const std::vector<Decimal>& series2,
		      const char *kernelName)
    {
      if (series1.size() != series2.size())
	throw std::domain_error(std::string(kernelName) + ": series lengths must be the same");
    }

    // Tracks the most recent missing value so that the "window contains a
    // missing value" test is constant time.
    class MissingTracker
    {
    public:
      MissingTracker()
	: mSeen(false),
	  mLastMissing(0)
      {}

      template <class Decimal>
      void observe(std::size_t index, Decimal value)
      {
	if (isMissing(value))
	  {
	    mSeen = true;
	    mLastMissing = index;
	  }
      }

      // true if row 'index' closes a full window of 'period' valid values
      bool windowComplete(std::size_t index, std::size_t period) const
      {
	if (index + 1 < period)
	  return false;

	if (!mSeen)
	  return true;

	return (index - mLastMissing) >= period;
      }

    private:
      bool mSeen;
      std::size_t mLastMissing;
    };
  }

  /**
   * @brief Simple moving average over a trailing window.
   *
   * @tparam Decimal Floating point value type.
   * @param values The input series.
   * @param period Window length w.
   * @return Series whose row i (i >= w-1) holds the arithmetic mean of
   *         values[i-w+1..i]; rows 0..w-2 are missing.
   * @throws std::domain_error if period is zero.
   */
  template <class Decimal>
  std::vector<Decimal> SmaSeries(const std::vector<Decimal>& values, std::size_t period)
  {
    using namespace boost::accumulators;

    detail::checkPeriod(period, "SmaSeries");

    std::vector<Decimal> result(values.size(), MissingValue<Decimal>());
    detail::MissingTracker tracker;

    for (std::size_t i = 0; i < values.size(); ++i)
      {
	tracker.observe(i, values[i]);
	if (!tracker.windowComplete(i, period))
	  continue;

	accumulator_set<Decimal, stats<tag::mean>> acc;
	for (std::size_t j = i + 1 - period; j <= i; ++j)
	  acc(values[j]);

	result[i] = mean(acc);
      }

    return result;
  }

  /**
   * @brief Exponential moving average with smoothing factor 2/(w+1).
   *
   * The first defined value is the simple moving average of the first w
   * consecutive valid values. A missing input produces a missing output and
   * restarts the seeding, so the average never silently skips a gap.
   *
   * @throws std::domain_error if period is zero.
   */
  template <class Decimal>
  std::vector<Decimal> EmaSeries(const std::vector<Decimal>& values, std::size_t period)
  {
    detail::checkPeriod(period, "EmaSeries");

    std::vector<Decimal> result(values.size(), MissingValue<Decimal>());
    const Decimal alpha = Decimal(2) / (Decimal(period) + Decimal(1));

    std::size_t validRun = 0;
    bool seeded = false;
    Decimal ema = Decimal(0);

    for (std::size_t i = 0; i < values.size(); ++i)
      {
	if (isMissing(values[i]))
	  {
	    validRun = 0;
	    seeded = false;
	    continue;
	  }

	++validRun;
	if (seeded)
	  {
	    ema = alpha * values[i] + (Decimal(1) - alpha) * ema;
	    result[i] = ema;
	  }
	else if (validRun >= period)
	  {
	    Decimal sum = Decimal(0);
	    for (std::size_t j = i + 1 - period; j <= i; ++j)
	      sum += values[j];

	    ema = sum / Decimal(period);
	    result[i] = ema;
	    seeded = true;
	  }
      }

    return result;
  }

  /**
   * @brief Lowest value of the trailing window.
   */
  template <class Decimal>
  std::vector<Decimal> RollingMinSeries(const std::vector<Decimal>& values, std::size_t period)
  {
    detail::checkPeriod(period, "RollingMinSeries");

    std::vector<Decimal> result(values.size(), MissingValue<Decimal>());
    detail::MissingTracker tracker;

    for (std::size_t i = 0; i < values.size(); ++i)
      {
	tracker.observe(i, values[i]);
	if (tracker.windowComplete(i, period))
	  result[i] = *std::min_element(values.begin() + (i + 1 - period),
					values.begin() + (i + 1));
      }

    return result;
  }

  /**
   * @brief Highest value of the trailing window.
   */
  template <class Decimal>
  std::vector<Decimal> RollingMaxSeries(const std::vector<Decimal>& values, std::size_t period)
  {
    detail::checkPeriod(period, "RollingMaxSeries");

    std::vector<Decimal> result(values.size(), MissingValue<Decimal>());
    detail::MissingTracker tracker;

    for (std::size_t i = 0; i < values.size(); ++i)
      {
	tracker.observe(i, values[i]);
	if (tracker.windowComplete(i, period))
	  result[i] = *std::max_element(values.begin() + (i + 1 - period),
					values.begin() + (i + 1));
      }

    return result;
  }

  /**
   * @brief Population standard deviation of the trailing window.
   *
   * The divisor is the window length w (not w-1). Every indicator built on a
   * standard deviation goes through this kernel so the convention cannot
   * drift between consumers.
   */
  template <class Decimal>
  std::vector<Decimal> RollingStdDevSeries(const std::vector<Decimal>& values, std::size_t period)
  {
    using namespace boost::accumulators;

    detail::checkPeriod(period, "RollingStdDevSeries");

    std::vector<Decimal> result(values.size(), MissingValue<Decimal>());
    detail::MissingTracker tracker;

    for (std::size_t i = 0; i < values.size(); ++i)
      {
	tracker.observe(i, values[i]);
	if (!tracker.windowComplete(i, period))
	  continue;

	accumulator_set<Decimal, stats<tag::variance>> acc;
	for (std::size_t j = i + 1 - period; j <= i; ++j)
	  acc(values[j]);

	// guard against a tiny negative variance from rounding
	result[i] = std::sqrt(std::max(Decimal(0), variance(acc)));
      }

    return result;
  }

  /**
   * @brief True range: max(high-low, |high-prevClose|, |low-prevClose|).
   *
   * Row 0 has no previous close and is missing.
   *
   * @throws std::domain_error if the three series differ in length.
   */
  template <class Decimal>
  std::vector<Decimal> TrueRangeSeries(const std::vector<Decimal>& high,
				       const std::vector<Decimal>& low,
				       const std::vector<Decimal>& close)
  {
    detail::checkAligned(high, low, "TrueRangeSeries");
    detail::checkAligned(high, close, "TrueRangeSeries");

    std::vector<Decimal> result(high.size(), MissingValue<Decimal>());
    for (std::size_t i = 1; i < high.size(); ++i)
      {
	const Decimal prevClose = close[i - 1];
	if (isMissing(high[i]) || isMissing(low[i]) || isMissing(prevClose))
	  continue;

	result[i] = std::max({ high[i] - low[i],
			       std::fabs(high[i] - prevClose),
			       std::fabs(low[i] - prevClose) });
      }

    return result;
  }

  /**
   * @brief Stochastic %K from a close series and the matching rolling
   * lowest low / highest high series.
   *
   * %K = 100 * (close - lowest) / (highest - lowest). A zero range yields a
   * missing value instead of a division by zero.
   */
  template <class Decimal>
  std::vector<Decimal> StochasticKSeries(const std::vector<Decimal>& close,
					 const std::vector<Decimal>& lowest,
					 const std::vector<Decimal>& highest)
  {
    detail::checkAligned(close, lowest, "StochasticKSeries");
    detail::checkAligned(close, highest, "StochasticKSeries");

    std::vector<Decimal> result(close.size(), MissingValue<Decimal>());
    for (std::size_t i = 0; i < close.size(); ++i)
      {
	if (isMissing(close[i]) || isMissing(lowest[i]) || isMissing(highest[i]))
	  continue;

	const Decimal range = highest[i] - lowest[i];
	if (range == Decimal(0))
	  continue;

	result[i] = Decimal(100) * (close[i] - lowest[i]) / range;
      }

    return result;
  }

  /**
   * @brief Element-wise numerator / denominator. A zero denominator gives a
   * missing value.
   */
  template <class Decimal>
  std::vector<Decimal> RatioSeries(const std::vector<Decimal>& numerator,
				   const std::vector<Decimal>& denominator)
  {
    detail::checkAligned(numerator, denominator, "RatioSeries");

    std::vector<Decimal> result(numerator.size(), MissingValue<Decimal>());
    for (std::size_t i = 0; i < numerator.size(); ++i)
      {
	if (isMissing(numerator[i]) || isMissing(denominator[i]) ||
	    denominator[i] == Decimal(0))
	  continue;

	result[i] = numerator[i] / denominator[i];
      }

    return result;
  }

  /**
   * @brief Percentage rate of change against the value 'period' rows back.
   *
   * ROC = ((current / lookBack) - 1) * 100. Rows 0..period-1 have no
   * look-back value and are missing, as is any row whose look-back value is
   * zero.
   */
  template <class Decimal>
  std::vector<Decimal> RocSeries(const std::vector<Decimal>& values, std::size_t period)
  {
    detail::checkPeriod(period, "RocSeries");

    std::vector<Decimal> result(values.size(), MissingValue<Decimal>());
    for (std::size_t i = period; i < values.size(); ++i)
      {
	const Decimal prevValue = values[i - period];
	if (isMissing(values[i]) || isMissing(prevValue) || prevValue == Decimal(0))
	  continue;

	result[i] = ((values[i] / prevValue) - Decimal(1)) * Decimal(100);
      }

    return result;
  }

  /**
   * @brief Least-squares slope of the trailing window against the bar
   * offsets 0..w-1, i.e. the average change per bar.
   *
   * @throws std::domain_error if period is less than two.
   */
  template <class Decimal>
  std::vector<Decimal> LinearTrendSeries(const std::vector<Decimal>& values, std::size_t period)
  {
    if (period < 2)
      throw std::domain_error("LinearTrendSeries: period must be at least two");

    std::vector<Decimal> result(values.size(), MissingValue<Decimal>());
    detail::MissingTracker tracker;

    const Decimal xMean = Decimal(period - 1) / Decimal(2);
    Decimal sxx = Decimal(0);
    for (std::size_t k = 0; k < period; ++k)
      sxx += (Decimal(k) - xMean) * (Decimal(k) - xMean);

    for (std::size_t i = 0; i < values.size(); ++i)
      {
	tracker.observe(i, values[i]);
	if (!tracker.windowComplete(i, period))
	  continue;

	const std::size_t start = i + 1 - period;
	Decimal sxy = Decimal(0);
	for (std::size_t k = 0; k < period; ++k)
	  sxy += (Decimal(k) - xMean) * values[start + k];

	result[i] = sxy / sxx;
      }

    return result;
  }
} // namespace taindicators

#endif
