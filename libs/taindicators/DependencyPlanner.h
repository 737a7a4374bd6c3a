// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAINDICATORS_DEPENDENCY_PLANNER_H
#define __TAINDICATORS_DEPENDENCY_PLANNER_H 1

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include "IndicatorRegistry.h"
#include "Specifier.h"

namespace taindicators
{
  enum class NodeStatus
  {
    Planned,
    Computed
  };

  /**
   * @brief One computation in an execution plan.
   *
   * Dependencies are indices of earlier nodes in the same plan; the node never
   * refers to a node that comes after it.
   */
  struct PlanNode
  {
    PlanNode(const Specifier& spec,
	     const std::vector<std::size_t>& deps,
	     const std::vector<std::string>& inputs)
      : specifier(spec),
	dependencies(deps),
	requiredInputs(inputs),
	status(NodeStatus::Planned)
    {}

    Specifier specifier;
    std::vector<std::size_t> dependencies;
    std::vector<std::string> requiredInputs;
    NodeStatus status;
  };

  bool operator==(const PlanNode& lhs, const PlanNode& rhs);

  /**
   * @brief Topologically ordered, deduplicated list of computations that
   * satisfies a set of requested specifiers.
   */
  class ExecutionPlan
  {
  public:
    ExecutionPlan() = default;

    const std::vector<PlanNode>& getNodes() const
    {
      return mNodes;
    }

    std::vector<PlanNode>& getNodes()
    {
      return mNodes;
    }

    std::size_t size() const
    {
      return mNodes.size();
    }

    const PlanNode& getNode(std::size_t index) const
    {
      return mNodes.at(index);
    }

    // Requested specifiers in request order, without repeats
    const std::vector<Specifier>& getRequested() const
    {
      return mRequested;
    }

    boost::optional<std::size_t> indexOf(const Specifier& spec) const;

    /**
     * @brief Node indices grouped by dependency depth. Nodes within one level
     * do not depend on each other and may run concurrently.
     */
    std::vector<std::vector<std::size_t>> levels() const;

    // Sorted union of the base columns read by any node
    std::set<std::string> requiredInputs() const;

    std::size_t appendNode(const PlanNode& node);
    void addRequested(const Specifier& spec);

  private:
    std::vector<PlanNode> mNodes;
    std::vector<Specifier> mRequested;
    std::map<Specifier, std::size_t> mIndex;
  };

  bool operator==(const ExecutionPlan& lhs, const ExecutionPlan& rhs);

  /**
   * @brief Expands requested specifiers into an execution plan.
   *
   * Depth-first, post-order expansion: a node is appended only after every
   * sub-dependency it declares is already placed, and an equal specifier is
   * never placed twice. Dependencies are visited in the order the descriptor
   * declares them, so the same requests always produce the same plan.
   */
  class DependencyPlanner
  {
  public:
    explicit DependencyPlanner(const IndicatorRegistry& registry);

    /**
     * @throws CyclicDependencyException if a kind's sub-dependency chain leads
     *         back to itself.
     * @throws UnknownKindException or InvalidParameterException if a
     *         descriptor declares a sub-dependency the registry cannot satisfy.
     */
    ExecutionPlan plan(const std::vector<Specifier>& requests) const;

  private:
    std::size_t visit(const Specifier& spec,
		      ExecutionPlan& plan,
		      std::vector<Specifier>& visiting) const;

    const IndicatorRegistry& mRegistry;
  };
} // namespace taindicators

#endif
