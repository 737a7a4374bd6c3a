// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAINDICATORS_SERIES_H
#define __TAINDICATORS_SERIES_H 1

#include <cmath>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace taindicators
{
  /**
   * @brief A column of values aligned by position with the rows of a table.
   *
   * Missing values (warm-up rows, degenerate divisions) are stored as a
   * quiet NaN.
   */
  typedef std::vector<double> Series;

  template <class Decimal>
  inline Decimal MissingValue()
  {
    return std::numeric_limits<Decimal>::quiet_NaN();
  }

  template <class Decimal>
  inline bool isMissing(Decimal value)
  {
    return std::isnan(value);
  }

  template <class Decimal>
  inline std::size_t countMissing(const std::vector<Decimal>& values)
  {
    std::size_t n = 0;
    for (const Decimal& v : values)
      if (isMissing(v))
	++n;

    return n;
  }

  /**
   * @brief One output of an indicator. The name is empty for single output
   * indicators and names the component ("upper", "lower") otherwise.
   */
  struct NamedSeries
  {
    NamedSeries() = default;

    NamedSeries(const std::string& outputName, Series series)
      : name(outputName),
	values(std::move(series))
    {}

    std::string name;
    Series values;
  };

  typedef std::vector<NamedSeries> IndicatorOutputs;

  // Columns handed back to the caller, in the order they were requested
  typedef std::vector<std::pair<std::string, Series>> OutputColumns;
} // namespace taindicators

#endif
