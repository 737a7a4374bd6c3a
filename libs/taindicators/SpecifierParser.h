// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAINDICATORS_SPECIFIER_PARSER_H
#define __TAINDICATORS_SPECIFIER_PARSER_H 1

#include <string>
#include <vector>
#include "IndicatorRegistry.h"
#include "Specifier.h"

namespace taindicators
{
  /**
   * @brief Turns text such as "stochk_14" or "BBANDS_20_2.5" into a
   * canonical Specifier.
   *
   * The grammar is <kind>[_<param>]*. The kind is matched case-insensitively
   * against the registry; each parameter is a decimal number checked against
   * the kind's parameter schema. Omitted trailing optional parameters take
   * their schema defaults, so "sma" and "sma_14" parse to the same value.
   * Parsing has no side effects.
   */
  class SpecifierParser
  {
  public:
    explicit SpecifierParser(const IndicatorRegistry& registry);

    /**
     * @throws MalformedSpecifierException if the text does not tokenize.
     * @throws UnknownKindException if the kind is not registered.
     * @throws InvalidParameterException on a non-numeric parameter, a type or
     *         range violation, or a wrong number of parameters.
     */
    Specifier parse(const std::string& text) const;

    std::vector<Specifier> parseAll(const std::vector<std::string>& texts) const;

    /**
     * @brief Apply the arity, type and range rules to a parameter list built
     * in code (sub-dependencies). Defaults are filled in.
     *
     * @param specifierText Text reported in a failure.
     */
    Specifier validate(const std::string& kind,
		       const std::vector<double>& params,
		       const std::string& specifierText) const;

  private:
    const IndicatorRegistry& mRegistry;
  };

  // true if token is [+-]digits[.digits][(e|E)[+-]digits]
  bool isDecimalToken(const std::string& token);
} // namespace taindicators

#endif
