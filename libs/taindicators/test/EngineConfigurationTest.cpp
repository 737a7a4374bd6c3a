#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>
#include "EngineConfiguration.h"
#include "IndicatorRegistry.h"
#include "ParallelExecutors.h"

using namespace taindicators;

TEST_CASE("EngineConfiguration defaults", "[EngineConfiguration]")
{
  EngineConfiguration config;
  REQUIRE(config.getExecutorKind() == ExecutorKind::Sequential);
  REQUIRE(config.getNumThreads() == 0);
  REQUIRE_FALSE(config.isVerbose());
  REQUIRE(config.getColumnAliases().empty());
  REQUIRE(config.getIndicators().empty());

  const EngineConfiguration defaults = EngineConfiguration::createDefault();
  REQUIRE(defaults.getIndicators() ==
	  std::vector<std::string>({ "sma_60", "ema_50", "stochk_14", "stochk_365", "hilo_7" }));
  REQUIRE(defaults.validate(IndicatorRegistry::standard()).empty());
}

TEST_CASE("EngineConfiguration loads JSON", "[EngineConfiguration]")
{
  EngineConfiguration config;

  const std::string json = R"({
    "engine": { "executor": "thread_pool", "threads": 3, "verbose": true },
    "columns": { "close": "Close", "high": "High" },
    "indicators": [ "sma_14", "stochk_14", "bbands_20_2.5" ]
  })";

  REQUIRE(config.loadFromString(json));
  REQUIRE(config.getLastError().empty());
  REQUIRE(config.getExecutorKind() == ExecutorKind::ThreadPool);
  REQUIRE(config.getNumThreads() == 3);
  REQUIRE(config.isVerbose());
  REQUIRE(config.getColumnAliases().at("close") == "Close");
  REQUIRE(config.getColumnAliases().at("high") == "High");
  REQUIRE(config.getIndicators().size() == 3);

  SECTION("Executor and options")
  {
    const std::shared_ptr<concurrency::IParallelExecutor> executor = config.makeExecutor();
    REQUIRE(dynamic_cast<concurrency::ThreadPoolExecutor *>(executor.get()) != nullptr);
    REQUIRE(executor->numWorkers() == 3);

    int calls = 0;
    const EngineOptions options = config.toEngineOptions([&calls](const std::string&) { ++calls; });
    REQUIRE(options.verbose);
    REQUIRE(static_cast<bool>(options.executor));
    options.logCallback("hello");
    REQUIRE(calls == 1);
  }

  SECTION("Sections are optional")
  {
    REQUIRE(config.loadFromString(R"({ "engine": { "executor": "async" } })"));
    REQUIRE(config.getExecutorKind() == ExecutorKind::Async);
    REQUIRE(config.getIndicators().empty());
    REQUIRE(dynamic_cast<concurrency::StdAsyncExecutor *>(config.makeExecutor().get()) != nullptr);

    REQUIRE(config.loadFromString("{}"));
    REQUIRE(config.getExecutorKind() == ExecutorKind::Sequential);
    REQUIRE(config.makeExecutor()->numWorkers() == 1);
  }
}

TEST_CASE("EngineConfiguration rejects bad documents", "[EngineConfiguration][Exception]")
{
  EngineConfiguration config;
  REQUIRE(config.loadFromString(R"({ "indicators": [ "sma_5" ] })"));

  const std::vector<std::string> bad = {
    "{ not json",
    "[ 1, 2 ]",
    R"({ "engine": "fast" })",
    R"({ "engine": { "executor": "gpu" } })",
    R"({ "engine": { "executor": 3 } })",
    R"({ "engine": { "threads": -1 } })",
    R"({ "engine": { "verbose": "yes" } })",
    R"({ "columns": [ "close" ] })",
    R"({ "columns": { "close": 1 } })",
    R"({ "indicators": "sma_5" })",
    R"({ "indicators": [ "sma_5", 7 ] })"
  };

  for (const auto& json : bad)
    {
      INFO(json);
      REQUIRE_FALSE(config.loadFromString(json));
      REQUIRE_FALSE(config.getLastError().empty());

      // a failed load keeps the previous settings
      REQUIRE(config.getIndicators() == std::vector<std::string>({ "sma_5" }));
    }

  REQUIRE(config.loadFromString(R"({ "engine": { "executor": "gpu" } })") == false);
  REQUIRE(config.getLastError().find("gpu") != std::string::npos);

  REQUIRE_FALSE(config.loadFromFile("/nonexistent/taindicators.json"));
  REQUIRE(config.getLastError().find("Could not open") != std::string::npos);
}

TEST_CASE("EngineConfiguration validates indicators", "[EngineConfiguration]")
{
  EngineConfiguration config;
  config.setIndicators({ "sma_14", "sma_1min", "macd", "hilo_7" });

  const std::vector<std::string> errors = config.validate(IndicatorRegistry::standard());
  REQUIRE(errors.size() == 2);
  REQUIRE(errors[0].find("sma_1min") != std::string::npos);
  REQUIRE(errors[1].find("macd") != std::string::npos);
}

TEST_CASE("EngineConfiguration save and reload", "[EngineConfiguration]")
{
  EngineConfiguration config;
  config.setExecutorKind(ExecutorKind::Async);
  config.setNumThreads(2);
  config.setVerbose(true);
  config.setColumnAlias("close", "Adj Close");
  config.setIndicators({ "atr_10", "roc" });

  EngineConfiguration copy;
  REQUIRE(copy.loadFromString(config.toJsonString()));
  REQUIRE(copy.getExecutorKind() == ExecutorKind::Async);
  REQUIRE(copy.getNumThreads() == 2);
  REQUIRE(copy.isVerbose());
  REQUIRE(copy.getColumnAliases() == config.getColumnAliases());
  REQUIRE(copy.getIndicators() == config.getIndicators());

  const std::string path = "taindicators_config_test.json";
  REQUIRE(config.saveToFile(path));

  EngineConfiguration fromFile;
  REQUIRE(fromFile.loadFromFile(path));
  REQUIRE(fromFile.getIndicators() == config.getIndicators());
  std::remove(path.c_str());
}

TEST_CASE("Executor kind names", "[EngineConfiguration]")
{
  ExecutorKind kind = ExecutorKind::Async;
  REQUIRE(executorKindFromString("thread_pool", kind));
  REQUIRE(kind == ExecutorKind::ThreadPool);
  REQUIRE_FALSE(executorKindFromString("ThreadPool", kind));
  REQUIRE(kind == ExecutorKind::ThreadPool);

  REQUIRE(executorKindToString(ExecutorKind::Sequential) == "sequential");
  REQUIRE(executorKindToString(ExecutorKind::Async) == "async");
  REQUIRE(executorKindToString(ExecutorKind::ThreadPool) == "thread_pool");
}
