// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <cstddef>
#include <vector>
#include "IndicatorRegistry.h"
#include "NumericKernels.h"

namespace taindicators
{
  namespace
  {
    const char *const CLOSE = "close";
    const char *const HIGH = "high";
    const char *const LOW = "low";

    std::size_t periodOf(const std::vector<double>& params, std::size_t index = 0)
    {
      return static_cast<std::size_t>(params.at(index));
    }

    IndicatorOutputs single(Series values)
    {
      IndicatorOutputs outputs;
      outputs.emplace_back("", std::move(values));
      return outputs;
    }

    Specifier lowestOf(std::size_t period)
    {
      return Specifier("lowest", { static_cast<double>(period) });
    }

    Specifier highestOf(std::size_t period)
    {
      return Specifier("highest", { static_cast<double>(period) });
    }

    // Indicators with one window parameter whose first value appears at row w-1
    IndicatorDescriptor windowIndicator(const std::string& kind,
					const std::string& displayName,
					const std::string& description,
					const std::string& category,
					double defaultPeriod)
    {
      IndicatorDescriptor d(kind, displayName, description, category);
      d.parameters = { PeriodParameter("period", defaultPeriod) };
      d.warmup = [](const std::vector<double>& p) { return periodOf(p) - 1; };
      return d;
    }

    void registerMovingAverages(IndicatorRegistry& registry)
    {
      IndicatorDescriptor sma = windowIndicator("sma", "Simple Moving Average",
						"Arithmetic mean of the trailing window of closes",
						"trend", 14);
      sma.requiredInputs = { CLOSE };
      sma.compute = [](const ComputeContext& ctx) {
	return single(SmaSeries(ctx.input(CLOSE), ctx.intParam(0)));
      };
      registry.registerIndicator(sma);

      IndicatorDescriptor ema = windowIndicator("ema", "Exponential Moving Average",
						"Exponentially smoothed close, alpha = 2/(period+1), seeded by the SMA",
						"trend", 14);
      ema.requiredInputs = { CLOSE };
      ema.compute = [](const ComputeContext& ctx) {
	return single(EmaSeries(ctx.input(CLOSE), ctx.intParam(0)));
      };
      registry.registerIndicator(ema);

      IndicatorDescriptor trend = windowIndicator("trend", "Linear Trend",
						  "Least-squares slope of the close per bar over the trailing window",
						  "trend", 14);
      trend.parameters = { PeriodParameter("period", 14, 2) };
      trend.requiredInputs = { CLOSE };
      trend.compute = [](const ComputeContext& ctx) {
	return single(LinearTrendSeries(ctx.input(CLOSE), ctx.intParam(0)));
      };
      registry.registerIndicator(trend);
    }

    void registerRangeIndicators(IndicatorRegistry& registry)
    {
      IndicatorDescriptor highest = windowIndicator("highest", "Highest High",
						    "Rolling maximum of the high over the trailing window",
						    "range", 14);
      highest.requiredInputs = { HIGH };
      highest.compute = [](const ComputeContext& ctx) {
	return single(RollingMaxSeries(ctx.input(HIGH), ctx.intParam(0)));
      };
      registry.registerIndicator(highest);

      IndicatorDescriptor lowest = windowIndicator("lowest", "Lowest Low",
						   "Rolling minimum of the low over the trailing window",
						   "range", 14);
      lowest.requiredInputs = { LOW };
      lowest.compute = [](const ComputeContext& ctx) {
	return single(RollingMinSeries(ctx.input(LOW), ctx.intParam(0)));
      };
      registry.registerIndicator(lowest);

      IndicatorDescriptor hilo = windowIndicator("hilo", "High Low Ratio",
						 "Lowest low divided by highest high over the trailing window",
						 "range", 14);
      hilo.dependencies = [](const std::vector<double>& p) {
	return std::vector<Specifier>{ lowestOf(periodOf(p)), highestOf(periodOf(p)) };
      };
      hilo.compute = [](const ComputeContext& ctx) {
	std::size_t period = ctx.intParam(0);
	return single(RatioSeries(ctx.dependency(lowestOf(period)),
				  ctx.dependency(highestOf(period))));
      };
      registry.registerIndicator(hilo);

      IndicatorDescriptor tr("tr", "True Range",
			     "max(high-low, |high-prevClose|, |low-prevClose|); the first row is missing",
			     "volatility");
      tr.requiredInputs = { HIGH, LOW, CLOSE };
      tr.warmup = [](const std::vector<double>&) { return std::size_t(1); };
      tr.compute = [](const ComputeContext& ctx) {
	return single(TrueRangeSeries(ctx.input(HIGH), ctx.input(LOW), ctx.input(CLOSE)));
      };
      registry.registerIndicator(tr);

      IndicatorDescriptor atr("atr", "Average True Range",
			      "Simple moving average of the true range", "volatility");
      atr.parameters = { PeriodParameter("period", 14) };
      atr.warmup = [](const std::vector<double>& p) { return periodOf(p); };
      atr.dependencies = [](const std::vector<double>&) {
	return std::vector<Specifier>{ Specifier("tr") };
      };
      atr.compute = [](const ComputeContext& ctx) {
	return single(SmaSeries(ctx.dependency(Specifier("tr")), ctx.intParam(0)));
      };
      registry.registerIndicator(atr);
    }

    void registerOscillators(IndicatorRegistry& registry)
    {
      IndicatorDescriptor stochk = windowIndicator("stochk", "Stochastic %K",
						   "100*(close-lowest low)/(highest high-lowest low); missing when the range is zero",
						   "momentum", 14);
      stochk.requiredInputs = { CLOSE };
      stochk.dependencies = [](const std::vector<double>& p) {
	return std::vector<Specifier>{ lowestOf(periodOf(p)), highestOf(periodOf(p)) };
      };
      stochk.compute = [](const ComputeContext& ctx) {
	std::size_t period = ctx.intParam(0);
	return single(StochasticKSeries(ctx.input(CLOSE),
					ctx.dependency(lowestOf(period)),
					ctx.dependency(highestOf(period))));
      };
      registry.registerIndicator(stochk);

      IndicatorDescriptor stochd("stochd", "Stochastic %D",
				 "Simple moving average of stochastic %K", "momentum");
      stochd.parameters = { PeriodParameter("kperiod", 14), PeriodParameter("dperiod", 3) };
      stochd.warmup = [](const std::vector<double>& p) {
	return periodOf(p, 0) + periodOf(p, 1) - 2;
      };
      stochd.dependencies = [](const std::vector<double>& p) {
	return std::vector<Specifier>{ Specifier("stochk", { p.at(0) }) };
      };
      stochd.compute = [](const ComputeContext& ctx) {
	const Series& percentK = ctx.dependency(Specifier("stochk", { ctx.param(0) }));
	return single(SmaSeries(percentK, ctx.intParam(1)));
      };
      registry.registerIndicator(stochd);

      IndicatorDescriptor roc("roc", "Rate Of Change",
			      "Percentage change of the close against the close 'period' bars back",
			      "momentum");
      roc.parameters = { PeriodParameter("period", 12) };
      roc.requiredInputs = { CLOSE };
      roc.warmup = [](const std::vector<double>& p) { return periodOf(p); };
      roc.compute = [](const ComputeContext& ctx) {
	return single(RocSeries(ctx.input(CLOSE), ctx.intParam(0)));
      };
      registry.registerIndicator(roc);
    }

    void registerVolatilityBands(IndicatorRegistry& registry)
    {
      IndicatorDescriptor stddev = windowIndicator("stddev", "Standard Deviation",
						   "Population standard deviation of the close over the trailing window",
						   "volatility", 20);
      stddev.requiredInputs = { CLOSE };
      stddev.compute = [](const ComputeContext& ctx) {
	return single(RollingStdDevSeries(ctx.input(CLOSE), ctx.intParam(0)));
      };
      registry.registerIndicator(stddev);

      IndicatorDescriptor bbands = windowIndicator("bbands", "Bollinger Bands",
						   "SMA plus and minus width population standard deviations",
						   "volatility", 20);
      bbands.parameters.push_back(ParameterSpec("width", ParameterType::Real, 2.0, 0.0, 100.0));
      bbands.outputs = { "upper", "middle", "lower" };
      bbands.dependencies = [](const std::vector<double>& p) {
	return std::vector<Specifier>{ Specifier("sma", { p.at(0) }),
				       Specifier("stddev", { p.at(0) }) };
      };
      bbands.compute = [](const ComputeContext& ctx) {
	const Series& middle = ctx.dependency(Specifier("sma", { ctx.param(0) }));
	const Series& deviation = ctx.dependency(Specifier("stddev", { ctx.param(0) }));
	const double width = ctx.param(1);

	Series upper(middle.size(), MissingValue<double>());
	Series lower(middle.size(), MissingValue<double>());
	for (std::size_t i = 0; i < middle.size(); ++i)
	  {
	    if (isMissing(middle[i]) || isMissing(deviation[i]))
	      continue;

	    upper[i] = middle[i] + width * deviation[i];
	    lower[i] = middle[i] - width * deviation[i];
	  }

	IndicatorOutputs outputs;
	outputs.emplace_back("upper", std::move(upper));
	outputs.emplace_back("middle", middle);
	outputs.emplace_back("lower", std::move(lower));
	return outputs;
      };
      registry.registerIndicator(bbands);
    }
  }

  void registerStandardIndicators(IndicatorRegistry& registry)
  {
    registerMovingAverages(registry);
    registerRangeIndicators(registry);
    registerOscillators(registry);
    registerVolatilityBands(registry);
  }
}
