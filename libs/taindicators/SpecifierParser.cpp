// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <cctype>
#include <cmath>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include "SpecifierParser.h"
#include "IndicatorException.h"

namespace taindicators
{
  namespace
  {
    bool isDigit(char c)
    {
      return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }

    std::size_t skipDigits(const std::string& s, std::size_t pos)
    {
      while (pos < s.size() && isDigit(s[pos]))
	++pos;

      return pos;
    }

    bool isKindToken(const std::string& token)
    {
      if (token.empty() || !std::isalpha(static_cast<unsigned char>(token[0])))
	return false;

      for (char c : token)
	if (!std::isalnum(static_cast<unsigned char>(c)))
	  return false;

      return true;
    }

    // Snap a value onto the one its canonical text parses back to, so that
    // rendering and re-parsing always gives an equal Specifier
    double canonicalValue(double value)
    {
      if (value == 0.0)
	return 0.0;

      return boost::lexical_cast<double>(formatParameter(value));
    }
  }

  bool isDecimalToken(const std::string& token)
  {
    std::size_t pos = 0;
    if (pos < token.size() && (token[pos] == '+' || token[pos] == '-'))
      ++pos;

    std::size_t end = skipDigits(token, pos);
    if (end == pos)
      return false;
    pos = end;

    if (pos < token.size() && token[pos] == '.')
      {
	end = skipDigits(token, pos + 1);
	if (end == pos + 1)
	  return false;
	pos = end;
      }

    if (pos < token.size() && (token[pos] == 'e' || token[pos] == 'E'))
      {
	++pos;
	if (pos < token.size() && (token[pos] == '+' || token[pos] == '-'))
	  ++pos;

	end = skipDigits(token, pos);
	if (end == pos)
	  return false;
	pos = end;
      }

    return pos == token.size();
  }

  SpecifierParser::SpecifierParser(const IndicatorRegistry& registry)
    : mRegistry(registry)
  {}

  Specifier SpecifierParser::parse(const std::string& text) const
  {
    const std::string trimmed = boost::trim_copy(text);
    if (trimmed.empty())
      throw MalformedSpecifierException(text, "empty specifier");

    std::vector<std::string> tokens;
    boost::split(tokens, trimmed, boost::is_any_of("_"));

    for (const auto& token : tokens)
      if (token.empty())
	throw MalformedSpecifierException(text, "empty token");

    if (!isKindToken(tokens.front()))
      throw MalformedSpecifierException(text, "kind must be alphanumeric and start with a letter");

    const std::string kind = boost::to_lower_copy(tokens.front());
    if (!mRegistry.isKindAvailable(kind))
      throw UnknownKindException(text, kind);

    std::vector<double> params;
    params.reserve(tokens.size() - 1);
    for (std::size_t i = 1; i < tokens.size(); ++i)
      {
	const std::string& token = tokens[i];
	if (!isDecimalToken(token))
	  throw InvalidParameterException(text, "'" + token + "' is not a decimal number");

	double value;
	try
	  {
	    value = boost::lexical_cast<double>(token);
	  }
	catch (const boost::bad_lexical_cast&)
	  {
	    throw InvalidParameterException(text, "'" + token + "' is out of range");
	  }

	if (!std::isfinite(value))
	  throw InvalidParameterException(text, "'" + token + "' is not finite");

	params.push_back(value);
      }

    return validate(kind, params, text);
  }

  std::vector<Specifier> SpecifierParser::parseAll(const std::vector<std::string>& texts) const
  {
    std::vector<Specifier> specs;
    specs.reserve(texts.size());
    for (const auto& text : texts)
      specs.push_back(parse(text));

    return specs;
  }

  Specifier SpecifierParser::validate(const std::string& kind,
				      const std::vector<double>& params,
				      const std::string& specifierText) const
  {
    const IndicatorDescriptor& descriptor = mRegistry.lookup(kind);
    const ParameterSchema& schema = descriptor.parameters;

    if (params.size() > schema.size())
      throw InvalidParameterException(specifierText,
				      descriptor.kind + " takes at most " +
				      std::to_string(schema.size()) + " parameter(s), got " +
				      std::to_string(params.size()));

    const std::size_t required = countRequired(schema);
    if (params.size() < required)
      throw InvalidParameterException(specifierText,
				      descriptor.kind + " requires at least " +
				      std::to_string(required) + " parameter(s), got " +
				      std::to_string(params.size()));

    std::vector<double> canonical;
    canonical.reserve(schema.size());
    for (std::size_t i = 0; i < schema.size(); ++i)
      {
	const ParameterSpec& spec = schema[i];
	double value = (i < params.size()) ? params[i] : *spec.defaultValue;

	if (spec.isInteger() && std::floor(value) != value)
	  throw InvalidParameterException(specifierText,
					  spec.name + " must be an integer, got " +
					  formatParameter(value));

	if (value < spec.minValue || value > spec.maxValue)
	  throw InvalidParameterException(specifierText,
					  spec.name + " must be in [" + formatParameter(spec.minValue) +
					  ", " + formatParameter(spec.maxValue) + "], got " +
					  formatParameter(value));

	canonical.push_back(canonicalValue(value));
      }

    return Specifier(descriptor.kind, canonical);
  }
}
