// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAINDICATORS_INDICATOR_DESCRIPTOR_H
#define __TAINDICATORS_INDICATOR_DESCRIPTOR_H 1

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include "ParameterSchema.h"
#include "Series.h"
#include "Specifier.h"

namespace taindicators
{
  /**
   * @brief Everything a compute function may read: its own parameters, the
   * base columns its descriptor declared, and the results of the
   * sub-dependencies the planner placed before it.
   *
   * The context only borrows the series it points to; the engine keeps them
   * alive for the duration of the call.
   */
  class ComputeContext
  {
  public:
    ComputeContext(const Specifier& spec, std::size_t rowCount);

    const Specifier& getSpecifier() const
    {
      return mSpecifier;
    }

    const std::vector<double>& params() const
    {
      return mSpecifier.getParams();
    }

    double param(std::size_t index) const
    {
      return mSpecifier.getParam(index);
    }

    std::size_t intParam(std::size_t index) const;

    std::size_t rowCount() const
    {
      return mRowCount;
    }

    /**
     * @brief A base column declared in the descriptor's required inputs.
     * @throws EngineInvariantException if the column was not bound.
     */
    const Series& input(const std::string& column) const;

    /**
     * @brief An output of an already computed sub-dependency. An empty output
     * name selects the first (or only) output.
     * @throws EngineInvariantException if the dependency was not computed.
     */
    const Series& dependency(const Specifier& spec, const std::string& output = "") const;

    void bindInput(const std::string& column, const Series& values);
    void bindDependency(const Specifier& spec, const IndicatorOutputs& outputs);

  private:
    Specifier mSpecifier;
    std::size_t mRowCount;
    std::map<std::string, const Series *> mInputs;
    std::map<Specifier, const IndicatorOutputs *> mDependencies;
  };

  typedef std::function<std::vector<Specifier>(const std::vector<double>&)> DependencyFunction;
  typedef std::function<IndicatorOutputs(const ComputeContext&)> ComputeFunction;
  typedef std::function<std::size_t(const std::vector<double>&)> WarmupFunction;

  /**
   * @brief Registry entry for one indicator kind.
   *
   * Descriptors are filled in once at startup and are read-only afterwards.
   */
  struct IndicatorDescriptor
  {
    IndicatorDescriptor() = default;

    IndicatorDescriptor(const std::string& kindName,
			const std::string& display,
			const std::string& desc,
			const std::string& cat = "basic")
      : kind(kindName),
	displayName(display),
	description(desc),
	category(cat)
    {}

    bool isMultiOutput() const
    {
      return !outputs.empty();
    }

    std::size_t numOutputs() const
    {
      return outputs.empty() ? 1 : outputs.size();
    }

    // Sub-dependencies for a given parameter set; none when unset
    std::vector<Specifier> dependenciesFor(const std::vector<double>& params) const
    {
      if (dependencies)
	return dependencies(params);

      return std::vector<Specifier>();
    }

    std::string kind;                         ///< Lower-case kind name, e.g. "sma"
    std::string displayName;                  ///< Human-readable name
    std::string description;
    std::string category;                     ///< "trend", "momentum", "volatility", ...
    ParameterSchema parameters;
    std::vector<std::string> requiredInputs;  ///< Base columns read directly
    std::vector<std::string> outputs;         ///< Output names; empty for a single output
    DependencyFunction dependencies;
    ComputeFunction compute;
    WarmupFunction warmup;                    ///< Leading missing rows on gap-free input
  };
} // namespace taindicators

#endif
