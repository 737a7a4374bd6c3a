#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>
#include "ColumnSource.h"
#include "IndicatorComputer.h"
#include "IndicatorException.h"
#include "TestUtils.h"

using namespace taindicators;
using namespace taindicators::testing;

TEST_CASE("ColumnTable basics", "[ColumnTable]")
{
  ColumnTable table;
  REQUIRE(table.rowCount() == 0);
  REQUIRE(table.numColumns() == 0);

  table.addColumn("close", ascending(5));
  table.addColumn("high", ascending(5, 2.0));

  REQUIRE(table.rowCount() == 5);
  REQUIRE(table.numColumns() == 2);
  REQUIRE(table.columnNames() == std::vector<std::string>({ "close", "high" }));
  REQUIRE(table.hasColumn("close"));
  REQUIRE_FALSE(table.hasColumn("Close"));
  REQUIRE(table.getColumn("high")[0] == 2.0);

  SECTION("Duplicate names are rejected")
  {
    REQUIRE_THROWS_AS(table.addColumn("close", ascending(5)), std::invalid_argument);
  }

  SECTION("Length must match")
  {
    REQUIRE_THROWS_AS(table.addColumn("low", ascending(4)), std::invalid_argument);
    REQUIRE_THROWS_AS(table.setColumn("close", ascending(6)), std::invalid_argument);
  }

  SECTION("setColumn inserts or replaces")
  {
    table.setColumn("close", Series(5, 7.0));
    table.setColumn("low", Series(5, 1.0));

    REQUIRE(table.getColumn("close")[3] == 7.0);
    REQUIRE(table.columnNames() == std::vector<std::string>({ "close", "high", "low" }));
  }

  SECTION("Missing column")
  {
    try
      {
	table.getColumn("volume");
	FAIL("expected MissingColumnException");
      }
    catch (const MissingColumnException& e)
      {
	REQUIRE(e.getColumnName() == "volume");
      }
  }

  SECTION("mergeColumns keeps the given order")
  {
    OutputColumns columns;
    columns.emplace_back("sma_3", Series(5, 1.0));
    columns.emplace_back("ema_3", Series(5, 2.0));
    table.mergeColumns(columns);

    REQUIRE(table.columnNames() ==
	    std::vector<std::string>({ "close", "high", "sma_3", "ema_3" }));
  }
}

TEST_CASE("AliasedColumnSource maps engine names to table names", "[AliasedColumnSource]")
{
  ColumnTable table;
  table.addColumn("Close", ascending(30));
  table.addColumn("px_high", ascending(30, 2.0));
  table.addColumn("low", ascending(30, 0.5));

  const std::map<std::string, std::string> aliases = {
    { "close", "Close" }, { "high", "px_high" }, { "volume", "Vol" }
  };
  const AliasedColumnSource source(table, aliases);

  REQUIRE(source.rowCount() == 30);
  REQUIRE(source.resolve("close") == "Close");
  REQUIRE(source.resolve("low") == "low");
  REQUIRE(source.hasColumn("close"));
  REQUIRE(source.hasColumn("high"));
  REQUIRE(source.hasColumn("low"));
  REQUIRE_FALSE(source.hasColumn("volume"));
  REQUIRE(source.getColumn("high")[0] == 2.0);
  REQUIRE(source.columnNames() == std::vector<std::string>({ "close", "high", "low" }));

  SECTION("Mapped column that does not exist")
  {
    try
      {
	source.getColumn("volume");
	FAIL("expected MissingColumnException");
      }
    catch (const MissingColumnException& e)
      {
	REQUIRE(e.getColumnName() == "volume");
	REQUIRE(std::string(e.what()).find("Vol") != std::string::npos);
      }
  }

  SECTION("Indicators read through the aliases")
  {
    IndicatorComputer computer;
    const OutputColumns columns = computer.compute({ "sma_5", "stochk_5" }, source);

    REQUIRE(columns.size() == 2);
    REQUIRE(columns[0].second[4] == Catch::Approx(3.0));
    REQUIRE(leadingMissing(columns[1].second) == 4);
    REQUIRE_FALSE(table.hasColumn("sma_5"));
  }
}
