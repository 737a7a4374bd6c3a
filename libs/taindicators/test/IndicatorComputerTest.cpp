#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <memory>
#include <string>
#include <vector>
#include "IndicatorComputer.h"
#include "IndicatorException.h"
#include "ParallelExecutors.h"
#include "TestUtils.h"

using namespace taindicators;
using namespace taindicators::testing;
using Catch::Approx;

TEST_CASE("sma_5 over an ascending close", "[IndicatorComputer][EndToEnd]")
{
  ColumnTable table;
  table.addColumn("close", ascending(30));   // 1..30

  IndicatorComputer computer;
  const OutputColumns columns = computer.compute({ "sma_5" }, table);

  REQUIRE(columns.size() == 1);
  REQUIRE(columns[0].first == "sma_5");

  const Series& sma = columns[0].second;
  REQUIRE(sma.size() == 30);
  for (std::size_t i = 0; i < 4; ++i)
    REQUIRE(isMissing(sma[i]));
  for (std::size_t i = 4; i < 30; ++i)
    REQUIRE(sma[i] == Approx(static_cast<double>(i - 1)));   // 3, 4, ..., 28

  REQUIRE(table.numColumns() == 1);
}

TEST_CASE("stochk_3 over a flat market is all missing", "[IndicatorComputer][EndToEnd]")
{
  ColumnTable table;
  table.addColumn("high", Series(25, 10.0));
  table.addColumn("low", Series(25, 10.0));
  table.addColumn("close", Series(25, 10.0));

  IndicatorComputer computer;
  OutputColumns columns;
  REQUIRE_NOTHROW(columns = computer.compute({ "stochk_3" }, table));

  REQUIRE(columns.size() == 1);
  REQUIRE(columns[0].first == "stochk_3");
  REQUIRE(countMissing(columns[0].second) == 25);
}

TEST_CASE("Repeated requests are returned once in first-seen order", "[IndicatorComputer]")
{
  const ColumnTable table = makeOhlcTable(50);
  IndicatorComputer computer;

  const OutputColumns columns =
    computer.compute({ "ema_5", "sma", "SMA_14", "Ema_5", "sma_14.0", "tr" }, table);

  REQUIRE(columns.size() == 3);
  REQUIRE(columns[0].first == "ema_5");
  REQUIRE(columns[1].first == "sma_14");
  REQUIRE(columns[2].first == "tr");
}

TEST_CASE("A bad specifier anywhere fails the whole call", "[IndicatorComputer][Exception]")
{
  ColumnTable table = makeOhlcTable(20);
  IndicatorComputer computer;

  REQUIRE_THROWS_AS(computer.compute({ "sma_5", "bogus_3" }, table), UnknownKindException);
  REQUIRE_THROWS_AS(computer.compute({ "sma_5", "sma_1min" }, table), InvalidParameterException);
  REQUIRE_THROWS_AS(computer.compute({ "sma_5", "" }, table), MalformedSpecifierException);

  REQUIRE_THROWS_AS(computer.attach({ "ema_3", "sma_0" }, table), SpecifierException);
  REQUIRE(table.numColumns() == 4);

  SECTION("Missing columns are reported before computing")
  {
    ColumnTable closeOnly;
    closeOnly.addColumn("close", ascending(20));

    try
      {
	computer.compute({ "sma_5", "stochk_5" }, closeOnly);
	FAIL("expected MissingColumnException");
      }
    catch (const MissingColumnException& e)
      {
	REQUIRE(e.getColumnName() == "low");
      }
  }
}

TEST_CASE("attach merges computed columns into the table", "[IndicatorComputer]")
{
  ColumnTable table = makeOhlcTable(40);
  IndicatorComputer computer;

  computer.attach({ "hilo_7", "bbands_10_1.5" }, table);

  REQUIRE(table.columnNames() == std::vector<std::string>({
	"open", "high", "low", "close",
	"hilo_7", "bbands_10_1.5_upper", "bbands_10_1.5_middle", "bbands_10_1.5_lower" }));

  const Series& hilo = table.getColumn("hilo_7");
  REQUIRE(leadingMissing(hilo) == 6);
  for (std::size_t i = 6; i < hilo.size(); ++i)
    {
      REQUIRE(hilo[i] > 0.0);
      REQUIRE(hilo[i] < 1.0);
    }

  SECTION("Attaching again replaces the columns")
  {
    computer.attach({ "hilo_7" }, table);
    REQUIRE(table.numColumns() == 8);
  }
}

TEST_CASE("Leading missing rows match each kind's warm-up", "[IndicatorComputer][Warmup]")
{
  const IndicatorRegistry& registry = IndicatorRegistry::standard();
  const ColumnTable table = makeOhlcTable(80);
  IndicatorComputer computer;
  SpecifierParser parser(registry);

  for (const auto& kind : registry.getAvailableKinds())
    {
      const Specifier spec = parser.parse(kind);
      const IndicatorDescriptor& descriptor = registry.lookup(kind);
      const std::size_t warmup = descriptor.warmup(spec.getParams());

      const OutputColumns columns = computer.compute({ kind }, table);
      REQUIRE(columns.size() == descriptor.numOutputs());

      for (const auto& column : columns)
	{
	  INFO(column.first);
	  REQUIRE(leadingMissing(column.second) == warmup);
	  REQUIRE(countMissing(column.second) == warmup);
	}
    }
}

TEST_CASE("Results do not depend on the executor", "[IndicatorComputer][Parallel]")
{
  const ColumnTable table = makeOhlcTable(200);
  const std::vector<std::string> requests = {
    "sma_60", "ema_50", "stochk_14", "stochk_365", "hilo_7", "stochd", "atr", "bbands"
  };

  const OutputColumns expected = IndicatorComputer().compute(requests, table);

  EngineOptions options;
  options.executor = std::make_shared<concurrency::ThreadPoolExecutor>(3);
  IndicatorComputer parallel(IndicatorRegistry::standard(), options);
  const OutputColumns actual = parallel.compute(requests, table);

  REQUIRE(actual.size() == expected.size());
  for (std::size_t i = 0; i < expected.size(); ++i)
    {
      REQUIRE(actual[i].first == expected[i].first);
      REQUIRE(sameSeries(actual[i].second, expected[i].second));
    }

  // stochk_365 never fills its window on 200 rows
  REQUIRE(countMissing(findColumn(actual, "stochk_365")) == 200);
}

TEST_CASE("prepare exposes the plan without computing", "[IndicatorComputer]")
{
  IndicatorComputer computer;
  const ExecutionPlan plan = computer.prepare({ "stochd_5_3", "stochk_5" });

  REQUIRE(plan.size() == 4);
  REQUIRE(plan.getRequested().size() == 2);
  for (const auto& node : plan.getNodes())
    REQUIRE(node.status == NodeStatus::Planned);

  REQUIRE(&computer.getRegistry() == &IndicatorRegistry::standard());
}
