// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <algorithm>
#include "DependencyPlanner.h"
#include "IndicatorException.h"
#include "SpecifierParser.h"

namespace taindicators
{
  bool operator==(const PlanNode& lhs, const PlanNode& rhs)
  {
    return (lhs.specifier == rhs.specifier) &&
      (lhs.dependencies == rhs.dependencies) &&
      (lhs.requiredInputs == rhs.requiredInputs) &&
      (lhs.status == rhs.status);
  }

  boost::optional<std::size_t> ExecutionPlan::indexOf(const Specifier& spec) const
  {
    auto it = mIndex.find(spec);
    if (it == mIndex.end())
      return boost::none;

    return it->second;
  }

  std::vector<std::vector<std::size_t>> ExecutionPlan::levels() const
  {
    std::vector<std::size_t> depth(mNodes.size(), 0);
    std::size_t maxDepth = 0;

    for (std::size_t i = 0; i < mNodes.size(); ++i)
      {
	for (std::size_t dep : mNodes[i].dependencies)
	  depth[i] = std::max(depth[i], depth[dep] + 1);

	maxDepth = std::max(maxDepth, depth[i]);
      }

    std::vector<std::vector<std::size_t>> result;
    if (mNodes.empty())
      return result;

    result.resize(maxDepth + 1);
    for (std::size_t i = 0; i < mNodes.size(); ++i)
      result[depth[i]].push_back(i);

    return result;
  }

  std::set<std::string> ExecutionPlan::requiredInputs() const
  {
    std::set<std::string> inputs;
    for (const auto& node : mNodes)
      inputs.insert(node.requiredInputs.begin(), node.requiredInputs.end());

    return inputs;
  }

  std::size_t ExecutionPlan::appendNode(const PlanNode& node)
  {
    if (mIndex.find(node.specifier) != mIndex.end())
      throw EngineInvariantException("ExecutionPlan: " + node.specifier.toString() +
				     " is already planned");

    for (std::size_t dep : node.dependencies)
      if (dep >= mNodes.size())
	throw EngineInvariantException("ExecutionPlan: " + node.specifier.toString() +
				       " depends on a node that is not yet placed");

    mNodes.push_back(node);
    mIndex.emplace(node.specifier, mNodes.size() - 1);
    return mNodes.size() - 1;
  }

  void ExecutionPlan::addRequested(const Specifier& spec)
  {
    if (std::find(mRequested.begin(), mRequested.end(), spec) == mRequested.end())
      mRequested.push_back(spec);
  }

  bool operator==(const ExecutionPlan& lhs, const ExecutionPlan& rhs)
  {
    return (lhs.getNodes() == rhs.getNodes()) && (lhs.getRequested() == rhs.getRequested());
  }

  DependencyPlanner::DependencyPlanner(const IndicatorRegistry& registry)
    : mRegistry(registry)
  {}

  ExecutionPlan DependencyPlanner::plan(const std::vector<Specifier>& requests) const
  {
    ExecutionPlan result;
    std::vector<Specifier> visiting;

    for (const auto& spec : requests)
      {
	visit(spec, result, visiting);
	result.addRequested(spec);
      }

    return result;
  }

  std::size_t DependencyPlanner::visit(const Specifier& spec,
				       ExecutionPlan& plan,
				       std::vector<Specifier>& visiting) const
  {
    boost::optional<std::size_t> placed = plan.indexOf(spec);
    if (placed)
      return *placed;

    // A kind reappearing on the current path is a cycle even if the
    // parameters differ, otherwise the expansion would never terminate
    auto onPath = std::find_if(visiting.begin(), visiting.end(), [&spec](const Specifier& s) {
	return s.getKind() == spec.getKind();
      });

    if (onPath != visiting.end())
      {
	std::string chain;
	for (auto it = onPath; it != visiting.end(); ++it)
	  chain += it->toString() + " -> ";
	chain += spec.toString();

	throw CyclicDependencyException("Cyclic indicator dependency: " + chain);
      }

    visiting.push_back(spec);

    const IndicatorDescriptor& descriptor = mRegistry.lookup(spec.getKind());
    SpecifierParser parser(mRegistry);

    std::vector<std::size_t> dependencyIndices;
    for (const auto& dep : descriptor.dependenciesFor(spec.getParams()))
      {
	Specifier canonical = parser.validate(dep.getKind(), dep.getParams(), dep.toString());
	std::size_t index = visit(canonical, plan, visiting);

	if (std::find(dependencyIndices.begin(), dependencyIndices.end(), index) ==
	    dependencyIndices.end())
	  dependencyIndices.push_back(index);
      }

    visiting.pop_back();

    return plan.appendNode(PlanNode(spec, dependencyIndices, descriptor.requiredInputs));
  }
}
