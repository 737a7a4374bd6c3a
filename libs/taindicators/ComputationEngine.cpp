// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <chrono>
#include <stdexcept>
#include <boost/format.hpp>
#include "ComputationEngine.h"
#include "IndicatorException.h"
#include "ParallelFor.h"

namespace taindicators
{
  ResultSet::ResultSet(const ExecutionPlan& plan)
    : mIndex(),
      mSlots(plan.size()),
      mColumns()
  {
    for (std::size_t i = 0; i < plan.size(); ++i)
      mIndex.emplace(plan.getNode(i).specifier, i);
  }

  bool ResultSet::contains(const Specifier& spec) const
  {
    auto it = mIndex.find(spec);
    return (it != mIndex.end()) && hasSlot(it->second);
  }

  const IndicatorOutputs& ResultSet::getOutputs(const Specifier& spec) const
  {
    auto it = mIndex.find(spec);
    if (it == mIndex.end())
      throw std::invalid_argument("ResultSet: " + spec.toString() + " is not part of the plan");

    if (!hasSlot(it->second))
      throw std::invalid_argument("ResultSet: " + spec.toString() + " has not been computed");

    return *mSlots[it->second];
  }

  const Series& ResultSet::getSeries(const Specifier& spec, const std::string& output) const
  {
    const IndicatorOutputs& outputs = getOutputs(spec);
    for (const auto& named : outputs)
      if (named.name == output || output.empty())
	return named.values;

    throw std::invalid_argument("ResultSet: " + spec.toString() + " has no output named " + output);
  }

  std::size_t ResultSet::numComputed() const
  {
    std::size_t n = 0;
    for (const auto& slot : mSlots)
      if (slot)
	++n;

    return n;
  }

  bool ResultSet::hasSlot(std::size_t index) const
  {
    return (index < mSlots.size()) && static_cast<bool>(mSlots[index]);
  }

  const IndicatorOutputs& ResultSet::getSlot(std::size_t index) const
  {
    if (!hasSlot(index))
      throw EngineInvariantException("ResultSet: slot " + std::to_string(index) + " is empty");

    return *mSlots[index];
  }

  void ResultSet::setSlot(std::size_t index, IndicatorOutputs outputs)
  {
    if (index >= mSlots.size())
      throw EngineInvariantException("ResultSet: slot " + std::to_string(index) + " out of range");

    if (mSlots[index])
      throw EngineInvariantException("ResultSet: slot " + std::to_string(index) + " written twice");

    mSlots[index] = std::move(outputs);
  }

  void ResultSet::addColumn(const std::string& name, const Series& values)
  {
    mColumns.emplace_back(name, values);
  }

  ComputationEngine::ComputationEngine(const IndicatorRegistry& registry, EngineOptions options)
    : mRegistry(registry),
      mOptions(std::move(options)),
      mLogMutex()
  {}

  void ComputationEngine::validateInputs(const ExecutionPlan& plan, const ColumnSource& source) const
  {
    for (const auto& node : plan.getNodes())
      for (const auto& column : node.requiredInputs)
	if (!source.hasColumn(column))
	  throw MissingColumnException(column, "Missing column '" + column +
				       "' required by " + node.specifier.toString());
  }

  ResultSet ComputationEngine::execute(ExecutionPlan& plan, const ColumnSource& source) const
  {
    validateInputs(plan, source);

    ResultSet results(plan);
    const auto start = std::chrono::steady_clock::now();

    if (!mOptions.executor || mOptions.executor->numWorkers() <= 1)
      {
	for (std::size_t i = 0; i < plan.size(); ++i)
	  computeNode(i, plan, source, results);
      }
    else
      {
	const auto levels = plan.levels();
	logMessage("Executing " + std::to_string(plan.size()) + " nodes in " +
		   std::to_string(levels.size()) + " levels on " +
		   std::to_string(mOptions.executor->numWorkers()) + " workers");

	for (const auto& level : levels)
	  concurrency::parallel_for_each(*mOptions.executor, level, [&](std::size_t index) {
	      computeNode(index, plan, source, results);
	    });
      }

    exposeRequested(plan, results);

    const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start;
    logMessage(boost::str(boost::format("Computed %1% indicator node(s) for %2% request(s) over %3% rows in %4$.3f ms")
			  % plan.size() % plan.getRequested().size() % source.rowCount()
			  % elapsed.count()));

    return results;
  }

  void ComputationEngine::computeNode(std::size_t index,
				      ExecutionPlan& plan,
				      const ColumnSource& source,
				      ResultSet& results) const
  {
    PlanNode& node = plan.getNodes().at(index);
    const IndicatorDescriptor& descriptor = mRegistry.lookup(node.specifier.getKind());
    const std::size_t rows = source.rowCount();

    ComputeContext context(node.specifier, rows);
    for (const auto& column : node.requiredInputs)
      context.bindInput(column, source.getColumn(column));

    for (std::size_t dep : node.dependencies)
      {
	if (dep >= index || !results.hasSlot(dep))
	  throw EngineInvariantException("ComputationEngine: dependency " + std::to_string(dep) +
					 " of " + node.specifier.toString() + " is not available");

	context.bindDependency(plan.getNode(dep).specifier, results.getSlot(dep));
      }

    IndicatorOutputs outputs = descriptor.compute(context);

    if (outputs.size() != descriptor.numOutputs())
      throw EngineInvariantException("ComputationEngine: " + node.specifier.toString() +
				     " returned " + std::to_string(outputs.size()) +
				     " output(s), expected " + std::to_string(descriptor.numOutputs()));

    for (std::size_t i = 0; i < outputs.size(); ++i)
      {
	if (descriptor.isMultiOutput() && outputs[i].name != descriptor.outputs[i])
	  throw EngineInvariantException("ComputationEngine: " + node.specifier.toString() +
					 " output " + std::to_string(i) + " is named '" +
					 outputs[i].name + "', expected '" + descriptor.outputs[i] + "'");

	if (outputs[i].values.size() != rows)
	  throw EngineInvariantException("ComputationEngine: " + node.specifier.toString() +
					 " produced " + std::to_string(outputs[i].values.size()) +
					 " rows for a " + std::to_string(rows) + " row table");
      }

    results.setSlot(index, std::move(outputs));
    node.status = NodeStatus::Computed;

    if (mOptions.verbose)
      logMessage("Computed " + node.specifier.toString());
  }

  void ComputationEngine::exposeRequested(const ExecutionPlan& plan, ResultSet& results) const
  {
    for (const auto& spec : plan.getRequested())
      {
	boost::optional<std::size_t> index = plan.indexOf(spec);
	if (!index)
	  throw EngineInvariantException("ComputationEngine: requested " + spec.toString() +
					 " is missing from the plan");

	const IndicatorDescriptor& descriptor = mRegistry.lookup(spec.getKind());
	const IndicatorOutputs& outputs = results.getSlot(*index);
	const std::string name = spec.toString();

	if (descriptor.isMultiOutput())
	  {
	    for (const auto& named : outputs)
	      results.addColumn(name + "_" + named.name, named.values);
	  }
	else
	  results.addColumn(name, outputs.front().values);
      }
  }

  void ComputationEngine::logMessage(const std::string& message) const
  {
    if (mOptions.logCallback)
      {
	std::lock_guard<std::mutex> lock(mLogMutex);
	mOptions.logCallback(message);
      }
  }
}
