// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <algorithm>
#include <stdexcept>
#include "ColumnSource.h"
#include "IndicatorException.h"

namespace taindicators
{
  const Series& ColumnTable::getColumn(const std::string& name) const
  {
    auto it = mColumns.find(name);
    if (it == mColumns.end())
      throw MissingColumnException(name);

    return it->second;
  }

  bool ColumnTable::hasColumn(const std::string& name) const
  {
    return mColumns.find(name) != mColumns.end();
  }

  std::size_t ColumnTable::rowCount() const
  {
    if (mNames.empty())
      return 0;

    return mColumns.at(mNames.front()).size();
  }

  std::vector<std::string> ColumnTable::columnNames() const
  {
    return mNames;
  }

  void ColumnTable::checkLength(const std::string& name, const Series& values) const
  {
    if (!mNames.empty() && values.size() != rowCount())
      throw std::invalid_argument("ColumnTable: column " + name + " has " +
				  std::to_string(values.size()) + " rows, table has " +
				  std::to_string(rowCount()));
  }

  void ColumnTable::addColumn(const std::string& name, Series values)
  {
    if (hasColumn(name))
      throw std::invalid_argument("ColumnTable: column " + name + " already exists");

    checkLength(name, values);
    mNames.push_back(name);
    mColumns.emplace(name, std::move(values));
  }

  void ColumnTable::setColumn(const std::string& name, Series values)
  {
    auto it = mColumns.find(name);
    if (it == mColumns.end())
      {
	addColumn(name, std::move(values));
	return;
      }

    // replacing the only column may change the row count
    if (mNames.size() > 1)
      checkLength(name, values);

    it->second = std::move(values);
  }

  void ColumnTable::mergeColumns(const OutputColumns& columns)
  {
    for (const auto& column : columns)
      setColumn(column.first, column.second);
  }

  AliasedColumnSource::AliasedColumnSource(const ColumnSource& source,
					   const std::map<std::string, std::string>& aliases)
    : mSource(source),
      mAliases(aliases)
  {}

  const std::string& AliasedColumnSource::resolve(const std::string& name) const
  {
    auto it = mAliases.find(name);
    return (it == mAliases.end()) ? name : it->second;
  }

  const Series& AliasedColumnSource::getColumn(const std::string& name) const
  {
    const std::string& actual = resolve(name);
    if (!mSource.hasColumn(actual))
      {
	if (actual == name)
	  throw MissingColumnException(name);

	throw MissingColumnException(name, "Missing column: " + name + " (mapped to " + actual + ")");
      }

    return mSource.getColumn(actual);
  }

  bool AliasedColumnSource::hasColumn(const std::string& name) const
  {
    return mSource.hasColumn(resolve(name));
  }

  std::size_t AliasedColumnSource::rowCount() const
  {
    return mSource.rowCount();
  }

  std::vector<std::string> AliasedColumnSource::columnNames() const
  {
    std::vector<std::string> names = mSource.columnNames();
    for (const auto& alias : mAliases)
      {
	auto it = std::find(names.begin(), names.end(), alias.second);
	if (it != names.end())
	  *it = alias.first;
      }

    return names;
  }
}
