// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAINDICATORS_INDICATOR_EXCEPTION_H
#define __TAINDICATORS_INDICATOR_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace taindicators
{
  // Base class for errors caused by caller input. These are raised before
  // any kernel runs so no partial result is ever returned.
  class IndicatorException : public std::runtime_error
  {
  public:
    explicit IndicatorException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    virtual ~IndicatorException() = default;
  };

  class SpecifierException : public IndicatorException
  {
  public:
    SpecifierException(const std::string& specifierText, const std::string& msg)
      : IndicatorException(msg + ": '" + specifierText + "'"),
	mSpecifierText(specifierText)
    {}

    const std::string& getSpecifierText() const
    {
      return mSpecifierText;
    }

  private:
    std::string mSpecifierText;
  };

  class MalformedSpecifierException : public SpecifierException
  {
  public:
    MalformedSpecifierException(const std::string& specifierText, const std::string& msg)
      : SpecifierException(specifierText, "Malformed specifier (" + msg + ")")
    {}
  };

  class UnknownKindException : public SpecifierException
  {
  public:
    UnknownKindException(const std::string& specifierText, const std::string& kind)
      : SpecifierException(specifierText, "Unknown indicator kind " + kind),
	mKind(kind)
    {}

    const std::string& getKind() const
    {
      return mKind;
    }

  private:
    std::string mKind;
  };

  class InvalidParameterException : public SpecifierException
  {
  public:
    InvalidParameterException(const std::string& specifierText, const std::string& msg)
      : SpecifierException(specifierText, "Invalid parameter (" + msg + ")")
    {}
  };

  class MissingColumnException : public IndicatorException
  {
  public:
    MissingColumnException(const std::string& columnName, const std::string& msg)
      : IndicatorException(msg),
	mColumnName(columnName)
    {}

    explicit MissingColumnException(const std::string& columnName)
      : MissingColumnException(columnName, "Missing column: " + columnName)
    {}

    const std::string& getColumnName() const
    {
      return mColumnName;
    }

  private:
    std::string mColumnName;
  };

  // Base class for programming errors: a misconfigured registry or a broken
  // planner. The registry is fixed at startup so these are never recoverable.
  class IndicatorConfigurationException : public std::logic_error
  {
  public:
    explicit IndicatorConfigurationException(const std::string& msg)
      : std::logic_error(msg)
    {}

    virtual ~IndicatorConfigurationException() = default;
  };

  class DuplicateKindException : public IndicatorConfigurationException
  {
  public:
    explicit DuplicateKindException(const std::string& kind)
      : IndicatorConfigurationException("Indicator kind already registered: " + kind)
    {}
  };

  class CyclicDependencyException : public IndicatorConfigurationException
  {
  public:
    explicit CyclicDependencyException(const std::string& msg)
      : IndicatorConfigurationException(msg)
    {}
  };

  class EngineInvariantException : public IndicatorConfigurationException
  {
  public:
    explicit EngineInvariantException(const std::string& msg)
      : IndicatorConfigurationException(msg)
    {}
  };
} // namespace taindicators

#endif
