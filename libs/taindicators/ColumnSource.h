// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAINDICATORS_COLUMN_SOURCE_H
#define __TAINDICATORS_COLUMN_SOURCE_H 1

#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include "Series.h"

namespace taindicators
{
  /**
   * @brief Read-only columnar view of a table, the only access the engine has
   * to caller data.
   */
  class ColumnSource
  {
  public:
    virtual ~ColumnSource() = default;

    /**
     * @throws MissingColumnException if the column does not exist.
     */
    virtual const Series& getColumn(const std::string& name) const = 0;

    virtual bool hasColumn(const std::string& name) const = 0;

    virtual std::size_t rowCount() const = 0;

    virtual std::vector<std::string> columnNames() const = 0;
  };

  /**
   * @brief In-memory table of equally long named columns, kept in insertion
   * order. Computed indicator columns are merged back with mergeColumns().
   */
  class ColumnTable : public ColumnSource
  {
  public:
    ColumnTable() = default;

    const Series& getColumn(const std::string& name) const override;
    bool hasColumn(const std::string& name) const override;
    std::size_t rowCount() const override;
    std::vector<std::string> columnNames() const override;

    /**
     * @throws std::invalid_argument if the name is taken or the length differs
     *         from the existing row count.
     */
    void addColumn(const std::string& name, Series values);

    // Insert, or replace an existing column of the same name
    void setColumn(const std::string& name, Series values);

    void mergeColumns(const OutputColumns& columns);

    std::size_t numColumns() const
    {
      return mNames.size();
    }

  private:
    void checkLength(const std::string& name, const Series& values) const;

    std::vector<std::string> mNames;
    std::map<std::string, Series> mColumns;
  };

  /**
   * @brief Presents a table whose columns are named differently ("Close",
   * "px_high") under the names the indicators read ("close", "high").
   *
   * Names without an alias pass through unchanged. The wrapped source must
   * outlive the adapter.
   */
  class AliasedColumnSource : public ColumnSource
  {
  public:
    AliasedColumnSource(const ColumnSource& source,
			const std::map<std::string, std::string>& aliases);

    const Series& getColumn(const std::string& name) const override;
    bool hasColumn(const std::string& name) const override;
    std::size_t rowCount() const override;

    // Names as seen by the engine
    std::vector<std::string> columnNames() const override;

    const std::string& resolve(const std::string& name) const;

  private:
    const ColumnSource& mSource;
    std::map<std::string, std::string> mAliases;
  };
} // namespace taindicators

#endif
