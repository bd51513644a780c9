#include "engine/engine_registry.hpp"

#include "absl/memory/memory.h"
#include "absl/time/time.h"
#include "engine/javascript_engine.hpp"
#include "engine/python_engine.hpp"
#include "engine/typescript_engine.hpp"
#include "glog/logging.h"
#include "util/flags.hpp"
#include "util/which.hpp"

namespace engine {

EngineRegistry::~EngineRegistry() { Shutdown(); }

std::unique_ptr<EngineRegistry> EngineRegistry::WithDefaultEngines() {
  auto registry = absl::make_unique<EngineRegistry>();
  registry->Register(proto::PYTHON, []() {
    return absl::make_unique<PythonEngine>(
        util::which(FLAGS_python_interpreter));
  });
  registry->Register(proto::JAVASCRIPT, []() {
    return absl::make_unique<JavaScriptEngine>(
        util::which(FLAGS_node_interpreter));
  });
  registry->Register(proto::TYPESCRIPT, []() {
    return absl::make_unique<TypeScriptEngine>(
        util::which(FLAGS_node_interpreter));
  });
  return registry;
}

void EngineRegistry::Register(proto::Language language, Factory factory) {
  std::string name = factory()->Name();
  absl::MutexLock lock(&mutex_);
  CHECK(!init_called_) << "Engines must be registered before Init";
  Entry& entry = engines_[language];
  entry.factory = std::move(factory);
  entry.name = std::move(name);
}

void EngineRegistry::Init() {
  {
    absl::MutexLock lock(&mutex_);
    if (init_called_ || shutdown_) return;
    init_called_ = true;
  }
  prober_ = std::thread(&EngineRegistry::ProbeAll, this);
}

void EngineRegistry::ProbeAll() {
  std::vector<std::pair<proto::Language, Factory>> factories;
  {
    absl::MutexLock lock(&mutex_);
    for (const auto& engine : engines_) {
      factories.emplace_back(engine.first, engine.second.factory);
    }
  }
  for (const auto& factory : factories) {
    std::string error;
    bool ready = false;
    try {
      std::unique_ptr<ExecutionEngine> instance = factory.second();
      ready = instance->Probe(&error);
    } catch (const std::exception& e) {
      error = e.what();
    }
    absl::MutexLock lock(&mutex_);
    if (shutdown_) break;
    Entry& entry = engines_[factory.first];
    entry.probed = true;
    entry.ready = ready;
    entry.error = error;
    if (ready) {
      LOG(INFO) << entry.name << " engine is ready";
    } else {
      LOG(WARNING) << entry.name << " engine is not available: " << error;
    }
  }
  absl::MutexLock lock(&mutex_);
  probing_done_ = true;
}

bool EngineRegistry::WaitUntilReady(std::chrono::milliseconds timeout) {
  absl::MutexLock lock(&mutex_);
  auto done = [this]() {
    mutex_.AssertHeld();
    return probing_done_ || shutdown_;
  };
  return mutex_.AwaitWithTimeout(absl::Condition(&done),
                                 absl::FromChrono(timeout)) &&
         probing_done_;
}

bool EngineRegistry::IsReady(proto::Language language) const {
  absl::MutexLock lock(&mutex_);
  auto it = engines_.find(language);
  return !shutdown_ && it != engines_.end() && it->second.ready;
}

std::vector<EngineRegistry::EngineStatus> EngineRegistry::Status() const {
  absl::MutexLock lock(&mutex_);
  std::vector<EngineStatus> status;
  for (const auto& engine : engines_) {
    EngineStatus entry;
    entry.language = engine.first;
    entry.name = engine.second.name;
    entry.ready = !shutdown_ && engine.second.ready;
    entry.error = shutdown_ ? "shut down" : engine.second.error;
    status.push_back(std::move(entry));
  }
  return status;
}

std::unique_ptr<ExecutionEngine> EngineRegistry::Create(
    proto::Language language) const {
  Factory factory;
  {
    absl::MutexLock lock(&mutex_);
    if (shutdown_) throw engine_error("Engines have been shut down");
    auto it = engines_.find(language);
    if (it == engines_.end()) {
      throw engine_error("Unsupported language: " + LanguageName(language));
    }
    const Entry& entry = it->second;
    if (!entry.probed) {
      throw engine_error(entry.name + " engine is still starting");
    }
    if (!entry.ready) {
      throw engine_error(entry.name + " engine is not available: " +
                         entry.error);
    }
    factory = entry.factory;
  }
  return factory();
}

void EngineRegistry::Shutdown() {
  {
    absl::MutexLock lock(&mutex_);
    if (!shutdown_) LOG(INFO) << "Shutting down the engines";
    shutdown_ = true;
  }
  if (prober_.joinable()) prober_.join();
}

}  // namespace engine
