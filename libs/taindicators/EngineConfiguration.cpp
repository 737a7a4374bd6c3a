// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include "EngineConfiguration.h"
#include "IndicatorException.h"
#include "ParallelExecutors.h"
#include "SpecifierParser.h"

using namespace rapidjson;

namespace taindicators
{
  bool executorKindFromString(const std::string& name, ExecutorKind& kind)
  {
    if (name == "sequential")
      kind = ExecutorKind::Sequential;
    else if (name == "async")
      kind = ExecutorKind::Async;
    else if (name == "thread_pool")
      kind = ExecutorKind::ThreadPool;
    else
      return false;

    return true;
  }

  std::string executorKindToString(ExecutorKind kind)
  {
    switch (kind)
      {
      case ExecutorKind::Sequential:
	return "sequential";
      case ExecutorKind::Async:
	return "async";
      case ExecutorKind::ThreadPool:
	return "thread_pool";
      }

    throw std::invalid_argument("executorKindToString: unknown executor kind");
  }

  EngineConfiguration::EngineConfiguration()
    : mExecutorKind(ExecutorKind::Sequential),
      mNumThreads(0),
      mVerbose(false),
      mColumnAliases(),
      mIndicators(),
      mLastError()
  {}

  bool EngineConfiguration::loadFromFile(const std::string& configPath)
  {
    std::ifstream file(configPath);
    if (!file.is_open())
      {
	setError("Could not open configuration file: " + configPath);
	return false;
      }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadFromString(buffer.str());
  }

  bool EngineConfiguration::loadFromString(const std::string& jsonContent)
  {
    return parseJson(jsonContent);
  }

  bool EngineConfiguration::saveToFile(const std::string& configPath) const
  {
    std::ofstream file(configPath);
    if (!file.is_open())
      {
	setError("Could not open file for writing: " + configPath);
	return false;
      }

    file << toJsonString() << std::endl;
    return static_cast<bool>(file);
  }

  bool EngineConfiguration::parseJson(const std::string& jsonContent)
  {
    Document doc;
    doc.Parse(jsonContent.c_str());

    if (doc.HasParseError())
      {
	setError(std::string("JSON parse error at offset ") +
		 std::to_string(doc.GetErrorOffset()) + ": " +
		 GetParseError_En(doc.GetParseError()));
	return false;
      }

    if (!doc.IsObject())
      {
	setError("Configuration root must be a JSON object");
	return false;
      }

    // Parse into locals so a failure leaves the current settings untouched
    ExecutorKind executorKind = ExecutorKind::Sequential;
    std::size_t numThreads = 0;
    bool verbose = false;
    std::map<std::string, std::string> aliases;
    std::vector<std::string> indicators;

    if (doc.HasMember("engine"))
      {
	const Value& engine = doc["engine"];
	if (!engine.IsObject())
	  {
	    setError("'engine' must be an object");
	    return false;
	  }

	if (engine.HasMember("executor"))
	  {
	    if (!engine["executor"].IsString())
	      {
		setError("'engine.executor' must be a string");
		return false;
	      }

	    const std::string name = engine["executor"].GetString();
	    if (!executorKindFromString(name, executorKind))
	      {
		setError("Unknown executor '" + name +
			 "' (expected sequential, async or thread_pool)");
		return false;
	      }
	  }

	if (engine.HasMember("threads"))
	  {
	    if (!engine["threads"].IsUint())
	      {
		setError("'engine.threads' must be a non-negative integer");
		return false;
	      }

	    numThreads = engine["threads"].GetUint();
	  }

	if (engine.HasMember("verbose"))
	  {
	    if (!engine["verbose"].IsBool())
	      {
		setError("'engine.verbose' must be a boolean");
		return false;
	      }

	    verbose = engine["verbose"].GetBool();
	  }
      }

    if (doc.HasMember("columns"))
      {
	const Value& columns = doc["columns"];
	if (!columns.IsObject())
	  {
	    setError("'columns' must be an object");
	    return false;
	  }

	for (Value::ConstMemberIterator it = columns.MemberBegin(); it != columns.MemberEnd(); ++it)
	  {
	    if (!it->value.IsString())
	      {
		setError(std::string("Column alias for '") + it->name.GetString() +
			 "' must be a string");
		return false;
	      }

	    aliases[it->name.GetString()] = it->value.GetString();
	  }
      }

    if (doc.HasMember("indicators"))
      {
	const Value& list = doc["indicators"];
	if (!list.IsArray())
	  {
	    setError("'indicators' must be an array of strings");
	    return false;
	  }

	for (SizeType i = 0; i < list.Size(); ++i)
	  {
	    if (!list[i].IsString())
	      {
		setError("'indicators[" + std::to_string(i) + "]' must be a string");
		return false;
	      }

	    indicators.push_back(list[i].GetString());
	  }
      }

    mExecutorKind = executorKind;
    mNumThreads = numThreads;
    mVerbose = verbose;
    mColumnAliases = aliases;
    mIndicators = indicators;
    mLastError.clear();
    return true;
  }

  std::string EngineConfiguration::toJsonString() const
  {
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    Value engine(kObjectType);
    engine.AddMember("executor",
		     Value(executorKindToString(mExecutorKind).c_str(), allocator),
		     allocator);
    engine.AddMember("threads", static_cast<uint64_t>(mNumThreads), allocator);
    engine.AddMember("verbose", mVerbose, allocator);
    doc.AddMember("engine", engine, allocator);

    Value columns(kObjectType);
    for (const auto& alias : mColumnAliases)
      columns.AddMember(Value(alias.first.c_str(), allocator),
			Value(alias.second.c_str(), allocator),
			allocator);
    doc.AddMember("columns", columns, allocator);

    Value indicators(kArrayType);
    for (const auto& indicator : mIndicators)
      indicators.PushBack(Value(indicator.c_str(), allocator), allocator);
    doc.AddMember("indicators", indicators, allocator);

    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    doc.Accept(writer);

    return buffer.GetString();
  }

  std::vector<std::string> EngineConfiguration::validate(const IndicatorRegistry& registry) const
  {
    std::vector<std::string> errors;
    SpecifierParser parser(registry);

    for (const auto& indicator : mIndicators)
      {
	try
	  {
	    parser.parse(indicator);
	  }
	catch (const SpecifierException& e)
	  {
	    errors.push_back("Invalid indicator '" + indicator + "': " + e.what());
	  }
      }

    return errors;
  }

  std::shared_ptr<concurrency::IParallelExecutor> EngineConfiguration::makeExecutor() const
  {
    switch (mExecutorKind)
      {
      case ExecutorKind::Sequential:
	return std::make_shared<concurrency::SingleThreadExecutor>();
      case ExecutorKind::Async:
	return std::make_shared<concurrency::StdAsyncExecutor>();
      case ExecutorKind::ThreadPool:
	return std::make_shared<concurrency::ThreadPoolExecutor>(mNumThreads);
      }

    throw std::invalid_argument("EngineConfiguration: unknown executor kind");
  }

  EngineOptions EngineConfiguration::toEngineOptions(LogCallback logCallback) const
  {
    EngineOptions options;
    options.executor = makeExecutor();
    options.verbose = mVerbose;
    options.logCallback = std::move(logCallback);
    return options;
  }

  EngineConfiguration EngineConfiguration::createDefault()
  {
    EngineConfiguration config;
    config.mIndicators = { "sma_60", "ema_50", "stochk_14", "stochk_365", "hilo_7" };
    return config;
  }
}
