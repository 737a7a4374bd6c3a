#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <random>
#include <string>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <boost/program_options.hpp>
#include "ColumnSource.h"
#include "EngineConfiguration.h"
#include "IndicatorComputer.h"
#include "IndicatorException.h"
#include "IndicatorRegistry.h"
#include "LogStreams.h"
#include "Specifier.h"

namespace po = boost::program_options;

using namespace taindicators;

namespace
{

const std::vector<std::string> BASE_COLUMNS = { "time", "open", "high", "low", "close" };

void printUsage(const po::options_description& desc)
{
    std::cout << "taindicators - compute technical indicators over an OHLC table\n\n";
    std::cout << "Usage: taindicators [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  # Default indicator set over 1000 synthetic bars\n";
    std::cout << "  taindicators\n\n";
    std::cout << "  # Pick indicators and show the last 20 rows\n";
    std::cout << "  taindicators --indicators sma_20,bbands_20_2,atr --tail 20\n\n";
    std::cout << "  # Run on a thread pool and keep a log file\n";
    std::cout << "  taindicators --executor thread_pool --threads 4 --log-file run.log --verbose\n\n";
    std::cout << "  # Show the indicator vocabulary\n";
    std::cout << "  taindicators --list\n";
}

std::string describeParameters(const ParameterSchema& schema)
{
    std::vector<std::string> parts;
    for (const auto& p : schema)
    {
        std::string text = p.name;
        if (p.defaultValue)
            text += "=" + formatParameter(*p.defaultValue);
        if (!p.isInteger())
            text += " (real)";
        parts.push_back(text);
    }

    return parts.empty() ? std::string("-") : boost::algorithm::join(parts, ", ");
}

void listIndicators(const IndicatorRegistry& registry)
{
    for (const auto& category : registry.getAvailableCategories())
    {
        std::cout << category << ":\n";
        for (const auto& kind : registry.getKindsByCategory(category))
        {
            const IndicatorDescriptor& d = registry.lookup(kind);
            std::cout << boost::format("  %-8s %-30s %s\n")
                % d.kind % d.displayName % describeParameters(d.parameters);
            if (d.isMultiOutput())
                std::cout << boost::format("  %-8s outputs: %s\n")
                    % "" % boost::algorithm::join(d.outputs, ", ");
        }
        std::cout << std::endl;
    }
}

// Bars drifting upward with the row index: low below, high
// above, open and close scattered around the bar index, all at least 1.
ColumnTable makeSyntheticTable(std::size_t rows,
                               unsigned long seed,
                               const std::map<std::string, std::string>& aliases)
{
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<int> lowOffset(-100, -50);
    std::uniform_int_distribution<int> highOffset(50, 100);
    std::uniform_int_distribution<int> bodyOffset(-50, 50);

    Series time(rows), open(rows), high(rows), low(rows), close(rows);
    for (std::size_t i = 0; i < rows; ++i)
    {
        const int base = static_cast<int>(i);
        time[i] = base;
        low[i] = std::max(base + lowOffset(rng), 1);
        high[i] = std::max(base + highOffset(rng), 1);
        open[i] = std::max(base + bodyOffset(rng), 1);
        close[i] = std::max(base + bodyOffset(rng), 1);
    }

    auto tableName = [&aliases](const std::string& name) {
        auto it = aliases.find(name);
        return it == aliases.end() ? name : it->second;
    };

    ColumnTable table;
    table.addColumn(tableName("time"), time);
    table.addColumn(tableName("open"), open);
    table.addColumn(tableName("high"), high);
    table.addColumn(tableName("low"), low);
    table.addColumn(tableName("close"), close);
    return table;
}

std::string formatCell(double value)
{
    if (std::isnan(value))
        return (boost::format("%12s") % "NaN").str();

    return (boost::format("%12.4f") % value).str();
}

void printTail(const ColumnSource& table, const OutputColumns& columns, std::size_t tail)
{
    const std::size_t rows = table.rowCount();
    const std::size_t first = rows > tail ? rows - tail : 0;

    for (const auto& name : BASE_COLUMNS)
        std::cout << boost::format("%12s") % name;
    for (const auto& column : columns)
        std::cout << boost::format(" %s") % column.first;
    std::cout << std::endl;

    for (std::size_t row = first; row < rows; ++row)
    {
        for (const auto& name : BASE_COLUMNS)
            std::cout << formatCell(table.getColumn(name)[row]);
        for (const auto& column : columns)
            std::cout << " " << formatCell(column.second[row]);
        std::cout << std::endl;
    }
}

std::vector<std::string> splitIndicatorArgs(const std::vector<std::string>& args)
{
    std::vector<std::string> indicators;
    for (const auto& arg : args)
    {
        std::vector<std::string> parts;
        boost::split(parts, arg, boost::is_any_of(","));
        for (const auto& part : parts)
        {
            const std::string trimmed = boost::trim_copy(part);
            if (!trimmed.empty())
                indicators.push_back(trimmed);
        }
    }

    return indicators;
}

} // namespace

int main(int argc, char* argv[])
{
    try
    {
        po::options_description desc("Options");
        desc.add_options()
            ("help,h", "Show this help message")
            ("list,l", "List the available indicators and exit")
            ("config,c", po::value<std::string>(), "JSON configuration file")
            ("indicators,i", po::value<std::vector<std::string>>()->multitoken(),
             "Indicators to compute, e.g. sma_14 stochk_14 (comma or space separated)")
            ("rows,r", po::value<std::size_t>()->default_value(1000), "Number of synthetic bars")
            ("seed", po::value<unsigned long>()->default_value(42), "Random seed for the synthetic bars")
            ("tail,t", po::value<std::size_t>()->default_value(10), "Number of trailing rows to print")
            ("executor,e", po::value<std::string>(), "sequential, async or thread_pool (overrides config)")
            ("threads", po::value<std::size_t>(), "Worker threads for thread_pool (0 = hardware)")
            ("log-file", po::value<std::string>(), "Also write log messages to this file")
            ("verbose,v", "Log every computed indicator node");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            printUsage(desc);
            return 0;
        }

        const IndicatorRegistry& registry = IndicatorRegistry::standard();

        if (vm.count("list"))
        {
            listIndicators(registry);
            return 0;
        }

        EngineConfiguration config = EngineConfiguration::createDefault();
        if (vm.count("config"))
        {
            if (!config.loadFromFile(vm["config"].as<std::string>()))
            {
                std::cerr << "Error: " << config.getLastError() << std::endl;
                return 1;
            }
            if (config.getIndicators().empty())
                config.setIndicators(EngineConfiguration::createDefault().getIndicators());
        }

        if (vm.count("executor"))
        {
            ExecutorKind kind;
            const std::string name = vm["executor"].as<std::string>();
            if (!executorKindFromString(name, kind))
            {
                std::cerr << "Error: unknown executor '" << name << "'" << std::endl;
                return 1;
            }
            config.setExecutorKind(kind);
        }
        if (vm.count("threads"))
            config.setNumThreads(vm["threads"].as<std::size_t>());
        if (vm.count("verbose"))
            config.setVerbose(true);
        if (vm.count("indicators"))
            config.setIndicators(splitIndicatorArgs(vm["indicators"].as<std::vector<std::string>>()));

        const std::vector<std::string> errors = config.validate(registry);
        if (!errors.empty())
        {
            for (const auto& error : errors)
                std::cerr << "Error: " << error << std::endl;
            return 1;
        }

        app::LogSink logSink;
        if (vm.count("log-file"))
            logSink.openFile(vm["log-file"].as<std::string>());

        const ColumnTable table = makeSyntheticTable(vm["rows"].as<std::size_t>(),
                                                     vm["seed"].as<unsigned long>(),
                                                     config.getColumnAliases());
        const AliasedColumnSource source(table, config.getColumnAliases());

        logSink.write((boost::format("Generated %1% synthetic bars, executor %2%")
                       % source.rowCount() % executorKindToString(config.getExecutorKind())).str());

        IndicatorComputer computer(registry,
                                   config.toEngineOptions([&logSink](const std::string& msg) {
                                       logSink.write(msg);
                                   }));

        const OutputColumns columns = computer.compute(config.getIndicators(), source);
        printTail(source, columns, vm["tail"].as<std::size_t>());
    }
    catch (const SpecifierException& e)
    {
        std::cerr << "Error: invalid indicator '" << e.getSpecifierText() << "': " << e.what() << std::endl;
        return 1;
    }
    catch (const MissingColumnException& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
