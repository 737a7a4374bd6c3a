// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAINDICATORS_SPECIFIER_H
#define __TAINDICATORS_SPECIFIER_H 1

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace taindicators
{
  /**
   * @brief A typed request for one indicator instance: a lower-case kind and
   * its canonical (schema ordered, default filled) parameter values.
   *
   * Two specifiers are equal iff kind and parameters match exactly. Equality
   * is the key used to share sub-computations between indicators.
   */
  class Specifier
  {
  public:
    Specifier(const std::string& kind, const std::vector<double>& params);

    explicit Specifier(const std::string& kind);

    const std::string& getKind() const
    {
      return mKind;
    }

    const std::vector<double>& getParams() const
    {
      return mParams;
    }

    std::size_t getNumParams() const
    {
      return mParams.size();
    }

    double getParam(std::size_t index) const;

    /**
     * @brief Canonical text, <kind>_<param1>_<param2>..., used as the output
     * column name. Parsing this text yields an equal Specifier.
     */
    std::string toString() const;

  private:
    std::string mKind;
    std::vector<double> mParams;
  };

  bool operator==(const Specifier& lhs, const Specifier& rhs);
  bool operator!=(const Specifier& lhs, const Specifier& rhs);
  bool operator<(const Specifier& lhs, const Specifier& rhs);

  std::ostream& operator<<(std::ostream& os, const Specifier& spec);

  // Renders one parameter value the way it appears in a canonical name
  std::string formatParameter(double value);
} // namespace taindicators

#endif
