// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAINDICATORS_ENGINE_CONFIGURATION_H
#define __TAINDICATORS_ENGINE_CONFIGURATION_H 1

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "ComputationEngine.h"
#include "IndicatorRegistry.h"
#include "IParallelExecutor.h"

namespace taindicators
{
  enum class ExecutorKind
  {
    Sequential,
    Async,
    ThreadPool
  };

  // "sequential", "async" or "thread_pool"
  std::string executorKindToString(ExecutorKind kind);

  // false, leaving kind unchanged, if the name is not recognized
  bool executorKindFromString(const std::string& name, ExecutorKind& kind);

  /**
   * @brief JSON backed settings for an indicator run.
   *
   * Layout:
   * @code
   * {
   *   "engine":     { "executor": "thread_pool", "threads": 4, "verbose": false },
   *   "columns":    { "close": "Close", "high": "High", "low": "Low" },
   *   "indicators": [ "sma_14", "stochk_14" ]
   * }
   * @endcode
   * Every section is optional. A failed load leaves the previous settings in
   * place and records the reason in getLastError().
   */
  class EngineConfiguration
  {
  public:
    EngineConfiguration();

    bool loadFromFile(const std::string& configPath);
    bool loadFromString(const std::string& jsonContent);
    bool saveToFile(const std::string& configPath) const;

    std::string toJsonString() const;

    ExecutorKind getExecutorKind() const
    {
      return mExecutorKind;
    }

    void setExecutorKind(ExecutorKind kind)
    {
      mExecutorKind = kind;
    }

    // Zero selects the hardware concurrency
    std::size_t getNumThreads() const
    {
      return mNumThreads;
    }

    void setNumThreads(std::size_t numThreads)
    {
      mNumThreads = numThreads;
    }

    bool isVerbose() const
    {
      return mVerbose;
    }

    void setVerbose(bool verbose)
    {
      mVerbose = verbose;
    }

    // Engine column name -> caller column name
    const std::map<std::string, std::string>& getColumnAliases() const
    {
      return mColumnAliases;
    }

    void setColumnAlias(const std::string& engineName, const std::string& tableName)
    {
      mColumnAliases[engineName] = tableName;
    }

    const std::vector<std::string>& getIndicators() const
    {
      return mIndicators;
    }

    void setIndicators(const std::vector<std::string>& indicators)
    {
      mIndicators = indicators;
    }

    /**
     * @brief Check the indicator list against a registry.
     *
     * @return One message per indicator string that does not parse (empty if
     *         all are valid).
     */
    std::vector<std::string> validate(const IndicatorRegistry& registry) const;

    std::shared_ptr<concurrency::IParallelExecutor> makeExecutor() const;

    EngineOptions toEngineOptions(LogCallback logCallback = LogCallback()) const;

    const std::string& getLastError() const
    {
      return mLastError;
    }

    /**
     * @brief Sequential execution and the standard demo indicator list.
     */
    static EngineConfiguration createDefault();

  private:
    bool parseJson(const std::string& jsonContent);
    void setError(const std::string& error) const
    {
      mLastError = error;
    }

    ExecutorKind mExecutorKind;
    std::size_t mNumThreads;
    bool mVerbose;
    std::map<std::string, std::string> mColumnAliases;
    std::vector<std::string> mIndicators;
    mutable std::string mLastError;
  };
} // namespace taindicators

#endif
