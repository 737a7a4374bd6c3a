// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "IndicatorComputer.h"

namespace taindicators
{
  IndicatorComputer::IndicatorComputer(const IndicatorRegistry& registry, EngineOptions options)
    : mRegistry(registry),
      mParser(registry),
      mPlanner(registry),
      mEngine(registry, std::move(options))
  {}

  ExecutionPlan IndicatorComputer::prepare(const std::vector<std::string>& requested) const
  {
    return mPlanner.plan(mParser.parseAll(requested));
  }

  OutputColumns IndicatorComputer::compute(const std::vector<std::string>& requested,
					   const ColumnSource& table) const
  {
    ExecutionPlan plan = prepare(requested);
    ResultSet results = mEngine.execute(plan, table);
    return results.getColumns();
  }

  void IndicatorComputer::attach(const std::vector<std::string>& requested, ColumnTable& table) const
  {
    OutputColumns columns = compute(requested, table);
    table.mergeColumns(columns);
  }
}
