// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAINDICATORS_COMPUTATION_ENGINE_H
#define __TAINDICATORS_COMPUTATION_ENGINE_H 1

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include "ColumnSource.h"
#include "DependencyPlanner.h"
#include "IndicatorRegistry.h"
#include "Series.h"
#include "IParallelExecutor.h"

namespace taindicators
{
  typedef std::function<void(const std::string&)> LogCallback;

  /**
   * @brief Execution settings for ComputationEngine.
   *
   * Without an executor the plan runs sequentially on the calling thread.
   * With one, the nodes of each plan level are spread across it.
   */
  struct EngineOptions
  {
    EngineOptions() = default;

    std::shared_ptr<concurrency::IParallelExecutor> executor;
    bool verbose = false;       ///< Log every computed node, not just the summary
    LogCallback logCallback;    ///< Receives log messages; nothing is logged when unset
  };

  /**
   * @brief Results of executing one plan.
   *
   * Holds one write-once slot per plan node plus the caller-visible columns
   * for the requested specifiers. During parallel execution every node writes
   * only its own slot and reads slots of earlier levels, so no lock is needed.
   */
  class ResultSet
  {
  public:
    explicit ResultSet(const ExecutionPlan& plan);

    bool contains(const Specifier& spec) const;

    /**
     * @throws std::invalid_argument if the specifier was not part of the plan
     *         or has not been computed.
     */
    const IndicatorOutputs& getOutputs(const Specifier& spec) const;

    const Series& getSeries(const Specifier& spec, const std::string& output = "") const;

    // Requested columns in request order
    const OutputColumns& getColumns() const
    {
      return mColumns;
    }

    std::size_t numComputed() const;

    bool hasSlot(std::size_t index) const;
    const IndicatorOutputs& getSlot(std::size_t index) const;

    // @throws EngineInvariantException if the slot was already written
    void setSlot(std::size_t index, IndicatorOutputs outputs);

    void addColumn(const std::string& name, const Series& values);

  private:
    std::map<Specifier, std::size_t> mIndex;
    std::vector<boost::optional<IndicatorOutputs>> mSlots;
    OutputColumns mColumns;
  };

  /**
   * @brief Executes an ExecutionPlan against a column source.
   *
   * Every required base column is checked before the first kernel runs.
   * The source is only read, never modified.
   */
  class ComputationEngine
  {
  public:
    explicit ComputationEngine(const IndicatorRegistry& registry,
			       EngineOptions options = EngineOptions());

    ComputationEngine(const ComputationEngine&) = delete;
    ComputationEngine& operator=(const ComputationEngine&) = delete;

    /**
     * @brief Run every node of the plan and expose the requested indicators.
     *
     * Single output indicators are exposed under their canonical name;
     * multi-output indicators under <canonical>_<output> for each output.
     * Nodes are marked NodeStatus::Computed as they finish.
     *
     * @throws MissingColumnException if the source lacks a required column.
     * @throws EngineInvariantException if the plan is inconsistent or a
     *         compute function returns malformed output.
     */
    ResultSet execute(ExecutionPlan& plan, const ColumnSource& source) const;

    /**
     * @throws MissingColumnException naming the first missing column and the
     *         indicator that needs it.
     */
    void validateInputs(const ExecutionPlan& plan, const ColumnSource& source) const;

    const EngineOptions& getOptions() const
    {
      return mOptions;
    }

  private:
    void computeNode(std::size_t index,
		     ExecutionPlan& plan,
		     const ColumnSource& source,
		     ResultSet& results) const;

    void exposeRequested(const ExecutionPlan& plan, ResultSet& results) const;

    void logMessage(const std::string& message) const;

    const IndicatorRegistry& mRegistry;
    EngineOptions mOptions;
    mutable std::mutex mLogMutex;
  };
} // namespace taindicators

#endif
