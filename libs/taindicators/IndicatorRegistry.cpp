// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <boost/algorithm/string.hpp>
#include "IndicatorRegistry.h"
#include "IndicatorException.h"

namespace taindicators
{
  namespace
  {
    bool isValidKindName(const std::string& kind)
    {
      if (kind.empty() || !std::islower(static_cast<unsigned char>(kind[0])))
	return false;

      return std::all_of(kind.begin(), kind.end(), [](char c) {
	  unsigned char uc = static_cast<unsigned char>(c);
	  return std::islower(uc) || std::isdigit(uc);
	});
    }
  }

  void IndicatorRegistry::registerIndicator(const IndicatorDescriptor& descriptor)
  {
    if (!isValidKindName(descriptor.kind))
      throw std::invalid_argument("IndicatorRegistry: invalid kind name '" + descriptor.kind + "'");

    if (!descriptor.compute)
      throw std::invalid_argument("IndicatorRegistry: kind " + descriptor.kind +
				  " has no compute function");

    bool seenOptional = false;
    for (const auto& p : descriptor.parameters)
      {
	if (p.isRequired() && seenOptional)
	  throw std::invalid_argument("IndicatorRegistry: kind " + descriptor.kind +
				      " declares required parameter " + p.name +
				      " after an optional one");
	if (!p.isRequired())
	  seenOptional = true;
      }

    if (mDescriptors.find(descriptor.kind) != mDescriptors.end())
      throw DuplicateKindException(descriptor.kind);

    mDescriptors.emplace(descriptor.kind, descriptor);
  }

  const IndicatorDescriptor& IndicatorRegistry::lookup(const std::string& kind) const
  {
    auto it = mDescriptors.find(boost::to_lower_copy(kind));
    if (it == mDescriptors.end())
      throw UnknownKindException(kind, kind);

    return it->second;
  }

  bool IndicatorRegistry::isKindAvailable(const std::string& kind) const
  {
    return mDescriptors.find(boost::to_lower_copy(kind)) != mDescriptors.end();
  }

  std::vector<std::string> IndicatorRegistry::getAvailableKinds() const
  {
    std::vector<std::string> kinds;
    kinds.reserve(mDescriptors.size());
    for (const auto& entry : mDescriptors)
      kinds.push_back(entry.first);

    return kinds;
  }

  std::vector<std::string> IndicatorRegistry::getKindsByCategory(const std::string& category) const
  {
    std::vector<std::string> kinds;
    for (const auto& entry : mDescriptors)
      if (entry.second.category == category)
	kinds.push_back(entry.first);

    return kinds;
  }

  std::vector<std::string> IndicatorRegistry::getAvailableCategories() const
  {
    std::vector<std::string> categories;
    for (const auto& entry : mDescriptors)
      {
	const std::string& category = entry.second.category;
	if (std::find(categories.begin(), categories.end(), category) == categories.end())
	  categories.push_back(category);
      }

    return categories;
  }

  const IndicatorRegistry& IndicatorRegistry::standard()
  {
    static const IndicatorRegistry& registry = []() -> const IndicatorRegistry& {
      static IndicatorRegistry instance;
      registerStandardIndicators(instance);
      return instance;
    }();

    return registry;
  }
}
