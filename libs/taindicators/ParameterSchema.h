// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAINDICATORS_PARAMETER_SCHEMA_H
#define __TAINDICATORS_PARAMETER_SCHEMA_H 1

#include <limits>
#include <string>
#include <vector>
#include <boost/optional.hpp>

namespace taindicators
{
  enum class ParameterType
  {
    Integer,
    Real
  };

  /**
   * @brief Describes one positional parameter of an indicator kind.
   *
   * A parameter without a default value is required. Parameters that have a
   * default must come after all required ones so that omitted trailing
   * parameters can be filled in.
   */
  struct ParameterSpec
  {
    ParameterSpec(const std::string& paramName,
		  ParameterType paramType,
		  boost::optional<double> defaultVal = boost::none,
		  double minVal = std::numeric_limits<double>::lowest(),
		  double maxVal = std::numeric_limits<double>::max())
      : name(paramName),
	type(paramType),
	defaultValue(defaultVal),
	minValue(minVal),
	maxValue(maxVal)
    {}

    bool isRequired() const
    {
      return !defaultValue;
    }

    bool isInteger() const
    {
      return type == ParameterType::Integer;
    }

    std::string name;
    ParameterType type;
    boost::optional<double> defaultValue;
    double minValue;
    double maxValue;
  };

  typedef std::vector<ParameterSpec> ParameterSchema;

  // Window lengths: integral, at least 'minPeriod', optional with a default
  inline ParameterSpec PeriodParameter(const std::string& name, double defaultPeriod,
				       double minPeriod = 1)
  {
    return ParameterSpec(name, ParameterType::Integer, defaultPeriod, minPeriod, 100000);
  }

  inline std::size_t countRequired(const ParameterSchema& schema)
  {
    std::size_t n = 0;
    for (const auto& p : schema)
      if (p.isRequired())
	++n;

    return n;
  }
} // namespace taindicators

#endif
