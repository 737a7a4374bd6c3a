#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>
#include "IndicatorException.h"
#include "IndicatorRegistry.h"

using namespace taindicators;

namespace
{
  IndicatorDescriptor makeDescriptor(const std::string& kind)
  {
    IndicatorDescriptor d(kind, "Test " + kind, "test indicator", "test");
    d.compute = [](const ComputeContext& ctx) {
      IndicatorOutputs outputs;
      outputs.emplace_back("", Series(ctx.rowCount(), 1.0));
      return outputs;
    };
    return d;
  }

  bool contains(const std::vector<std::string>& names, const std::string& name)
  {
    return std::find(names.begin(), names.end(), name) != names.end();
  }
}

TEST_CASE("Standard registry vocabulary", "[IndicatorRegistry]")
{
  const IndicatorRegistry& registry = IndicatorRegistry::standard();

  const std::vector<std::string> expected = {
    "atr", "bbands", "ema", "highest", "hilo", "lowest", "roc",
    "sma", "stddev", "stochd", "stochk", "tr", "trend"
  };

  REQUIRE(registry.size() == expected.size());
  REQUIRE(registry.getAvailableKinds() == expected);
  REQUIRE(&registry == &IndicatorRegistry::standard());

  SECTION("Lookup is case-insensitive")
  {
    REQUIRE(registry.lookup("SMA").kind == "sma");
    REQUIRE(registry.isKindAvailable("StochK"));
    REQUIRE_FALSE(registry.isKindAvailable("macd"));
  }

  SECTION("Unknown kind")
  {
    REQUIRE_THROWS_AS(registry.lookup("macd"), UnknownKindException);
  }

  SECTION("Categories")
  {
    const std::vector<std::string> categories = registry.getAvailableCategories();
    REQUIRE(categories.size() == 4);
    REQUIRE(contains(categories, "trend"));
    REQUIRE(contains(categories, "range"));
    REQUIRE(contains(categories, "momentum"));
    REQUIRE(contains(categories, "volatility"));

    REQUIRE(registry.getKindsByCategory("momentum") ==
	    std::vector<std::string>({ "roc", "stochd", "stochk" }));
    REQUIRE(registry.getKindsByCategory("nonexistent").empty());
  }

  SECTION("Descriptor shapes")
  {
    const IndicatorDescriptor& bbands = registry.lookup("bbands");
    REQUIRE(bbands.isMultiOutput());
    REQUIRE(bbands.numOutputs() == 3);
    REQUIRE(bbands.outputs == std::vector<std::string>({ "upper", "middle", "lower" }));
    REQUIRE(bbands.parameters.size() == 2);
    REQUIRE_FALSE(bbands.parameters[1].isInteger());

    const IndicatorDescriptor& sma = registry.lookup("sma");
    REQUIRE_FALSE(sma.isMultiOutput());
    REQUIRE(sma.numOutputs() == 1);
    REQUIRE(sma.requiredInputs == std::vector<std::string>({ "close" }));
    REQUIRE(sma.dependenciesFor({ 14.0 }).empty());

    const std::vector<Specifier> stochkDeps = registry.lookup("stochk").dependenciesFor({ 9.0 });
    REQUIRE(stochkDeps.size() == 2);
    REQUIRE(stochkDeps[0] == Specifier("lowest", { 9.0 }));
    REQUIRE(stochkDeps[1] == Specifier("highest", { 9.0 }));
  }

  SECTION("Every kind declares its warm-up")
  {
    for (const auto& kind : registry.getAvailableKinds())
      REQUIRE(static_cast<bool>(registry.lookup(kind).warmup));

    REQUIRE(registry.lookup("sma").warmup({ 14.0 }) == 13);
    REQUIRE(registry.lookup("atr").warmup({ 14.0 }) == 14);
    REQUIRE(registry.lookup("stochd").warmup({ 14.0, 3.0 }) == 15);
    REQUIRE(registry.lookup("roc").warmup({ 12.0 }) == 12);
    REQUIRE(registry.lookup("tr").warmup({}) == 1);
  }
}

TEST_CASE("IndicatorRegistry registration rules", "[IndicatorRegistry]")
{
  IndicatorRegistry registry;
  REQUIRE(registry.size() == 0);

  registry.registerIndicator(makeDescriptor("custom1"));
  REQUIRE(registry.isKindAvailable("custom1"));
  REQUIRE(registry.lookup("CUSTOM1").displayName == "Test custom1");

  SECTION("Duplicate kind")
  {
    REQUIRE_THROWS_AS(registry.registerIndicator(makeDescriptor("custom1")), DuplicateKindException);
    REQUIRE(registry.size() == 1);
  }

  SECTION("Invalid kind names")
  {
    REQUIRE_THROWS_AS(registry.registerIndicator(makeDescriptor("")), std::invalid_argument);
    REQUIRE_THROWS_AS(registry.registerIndicator(makeDescriptor("Upper")), std::invalid_argument);
    REQUIRE_THROWS_AS(registry.registerIndicator(makeDescriptor("9lives")), std::invalid_argument);
    REQUIRE_THROWS_AS(registry.registerIndicator(makeDescriptor("two_parts")), std::invalid_argument);
  }

  SECTION("Missing compute function")
  {
    IndicatorDescriptor d("nocompute", "No compute", "");
    REQUIRE_THROWS_AS(registry.registerIndicator(d), std::invalid_argument);
  }

  SECTION("Required parameter after an optional one")
  {
    IndicatorDescriptor d = makeDescriptor("badschema");
    d.parameters = { PeriodParameter("period", 14),
		     ParameterSpec("factor", ParameterType::Real) };
    REQUIRE_THROWS_AS(registry.registerIndicator(d), std::invalid_argument);
  }

  SECTION("Private registries are independent of the standard one")
  {
    REQUIRE_FALSE(IndicatorRegistry::standard().isKindAvailable("custom1"));
    REQUIRE_FALSE(registry.isKindAvailable("sma"));
  }

  SECTION("registerStandardIndicators twice collides")
  {
    IndicatorRegistry other;
    registerStandardIndicators(other);
    REQUIRE(other.size() == 13);
    REQUIRE_THROWS_AS(registerStandardIndicators(other), DuplicateKindException);
  }
}
