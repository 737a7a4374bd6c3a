// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "IndicatorDescriptor.h"
#include "IndicatorException.h"

namespace taindicators
{
  ComputeContext::ComputeContext(const Specifier& spec, std::size_t rowCount)
    : mSpecifier(spec),
      mRowCount(rowCount),
      mInputs(),
      mDependencies()
  {}

  std::size_t ComputeContext::intParam(std::size_t index) const
  {
    return static_cast<std::size_t>(mSpecifier.getParam(index));
  }

  const Series& ComputeContext::input(const std::string& column) const
  {
    auto it = mInputs.find(column);
    if (it == mInputs.end())
      throw EngineInvariantException("ComputeContext::input - column " + column +
				     " was not declared as an input of " + mSpecifier.toString());

    return *it->second;
  }

  const Series& ComputeContext::dependency(const Specifier& spec, const std::string& output) const
  {
    auto it = mDependencies.find(spec);
    if (it == mDependencies.end())
      throw EngineInvariantException("ComputeContext::dependency - " + spec.toString() +
				     " has not been computed before " + mSpecifier.toString());

    const IndicatorOutputs& outputs = *it->second;
    if (outputs.empty())
      throw EngineInvariantException("ComputeContext::dependency - " + spec.toString() +
				     " produced no output");

    if (output.empty())
      return outputs.front().values;

    for (const auto& named : outputs)
      if (named.name == output)
	return named.values;

    throw EngineInvariantException("ComputeContext::dependency - " + spec.toString() +
				   " has no output named " + output);
  }

  void ComputeContext::bindInput(const std::string& column, const Series& values)
  {
    mInputs[column] = &values;
  }

  void ComputeContext::bindDependency(const Specifier& spec, const IndicatorOutputs& outputs)
  {
    mDependencies[spec] = &outputs;
  }
}
