// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include "Specifier.h"

namespace taindicators
{
  Specifier::Specifier(const std::string& kind, const std::vector<double>& params)
    : mKind(kind),
      mParams(params)
  {}

  Specifier::Specifier(const std::string& kind)
    : mKind(kind),
      mParams()
  {}

  double Specifier::getParam(std::size_t index) const
  {
    if (index >= mParams.size())
      throw std::out_of_range("Specifier::getParam - index " + std::to_string(index) +
			      " out of range for " + toString());

    return mParams[index];
  }

  std::string Specifier::toString() const
  {
    std::string name(mKind);
    for (double p : mParams)
      {
	name += '_';
	name += formatParameter(p);
      }

    return name;
  }

  std::string formatParameter(double value)
  {
    std::ostringstream os;
    os << std::setprecision(15) << value;
    return os.str();
  }

  bool operator==(const Specifier& lhs, const Specifier& rhs)
  {
    return (lhs.getKind() == rhs.getKind()) && (lhs.getParams() == rhs.getParams());
  }

  bool operator!=(const Specifier& lhs, const Specifier& rhs)
  {
    return !(lhs == rhs);
  }

  bool operator<(const Specifier& lhs, const Specifier& rhs)
  {
    if (lhs.getKind() != rhs.getKind())
      return lhs.getKind() < rhs.getKind();

    return std::lexicographical_compare(lhs.getParams().begin(), lhs.getParams().end(),
					rhs.getParams().begin(), rhs.getParams().end());
  }

  std::ostream& operator<<(std::ostream& os, const Specifier& spec)
  {
    os << spec.toString();
    return os;
  }
}
