// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAINDICATORS_INDICATOR_COMPUTER_H
#define __TAINDICATORS_INDICATOR_COMPUTER_H 1

#include <string>
#include <vector>
#include "ColumnSource.h"
#include "ComputationEngine.h"
#include "DependencyPlanner.h"
#include "IndicatorRegistry.h"
#include "SpecifierParser.h"

namespace taindicators
{
  /**
   * @brief Single entry point: indicator strings in, named columns out.
   *
   * compute() parses every requested string before planning, so a bad
   * specifier anywhere in the list fails the call before any kernel runs.
   * Repeated requests (including spellings that canonicalize equally, such
   * as "sma" and "SMA_14") are returned once, at their first position.
   */
  class IndicatorComputer
  {
  public:
    explicit IndicatorComputer(const IndicatorRegistry& registry = IndicatorRegistry::standard(),
			       EngineOptions options = EngineOptions());

    IndicatorComputer(const IndicatorComputer&) = delete;
    IndicatorComputer& operator=(const IndicatorComputer&) = delete;

    /**
     * @throws SpecifierException for the first unparsable request.
     * @throws MissingColumnException if the table lacks a needed base column.
     */
    OutputColumns compute(const std::vector<std::string>& requested,
			  const ColumnSource& table) const;

    // compute() followed by ColumnTable::mergeColumns
    void attach(const std::vector<std::string>& requested, ColumnTable& table) const;

    ExecutionPlan prepare(const std::vector<std::string>& requested) const;

    const IndicatorRegistry& getRegistry() const
    {
      return mRegistry;
    }

  private:
    const IndicatorRegistry& mRegistry;
    SpecifierParser mParser;
    DependencyPlanner mPlanner;
    ComputationEngine mEngine;
  };
} // namespace taindicators

#endif
