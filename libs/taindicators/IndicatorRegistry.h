// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAINDICATORS_INDICATOR_REGISTRY_H
#define __TAINDICATORS_INDICATOR_REGISTRY_H 1

#include <map>
#include <string>
#include <vector>
#include "IndicatorDescriptor.h"

namespace taindicators
{
  /**
   * @brief Mapping from indicator kind to its descriptor.
   *
   * A registry is populated once and then only read, which makes concurrent
   * lookups safe without locking. The process-wide vocabulary is available
   * through standard(); tests may build private registries, for example to
   * exercise a deliberately misconfigured dependency graph.
   */
  class IndicatorRegistry
  {
  public:
    IndicatorRegistry() = default;

    IndicatorRegistry(const IndicatorRegistry&) = delete;
    IndicatorRegistry& operator=(const IndicatorRegistry&) = delete;

    /**
     * @brief Add a descriptor.
     *
     * @throws std::invalid_argument if the kind is not a lower-case
     *         alphanumeric name starting with a letter, the compute function
     *         is missing, or a required parameter follows an optional one.
     * @throws DuplicateKindException if the kind is already registered.
     */
    void registerIndicator(const IndicatorDescriptor& descriptor);

    /**
     * @brief Case-insensitive lookup.
     * @throws UnknownKindException if the kind is not registered.
     */
    const IndicatorDescriptor& lookup(const std::string& kind) const;

    bool isKindAvailable(const std::string& kind) const;

    // Registered kinds in lexical order
    std::vector<std::string> getAvailableKinds() const;

    std::vector<std::string> getKindsByCategory(const std::string& category) const;

    std::vector<std::string> getAvailableCategories() const;

    std::size_t size() const
    {
      return mDescriptors.size();
    }

    /**
     * @brief The process-wide registry holding the standard indicators.
     *
     * Built on first use, never modified afterwards.
     */
    static const IndicatorRegistry& standard();

  private:
    std::map<std::string, IndicatorDescriptor> mDescriptors;
  };

  /**
   * @brief Register the built-in indicator vocabulary (sma, ema, highest,
   * lowest, hilo, stochk, stochd, tr, atr, stddev, bbands, roc, trend).
   */
  void registerStandardIndicators(IndicatorRegistry& registry);
} // namespace taindicators

#endif
