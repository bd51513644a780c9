#ifndef ENGINE_ENGINE_REGISTRY_HPP
#define ENGINE_ENGINE_REGISTRY_HPP

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "engine/execution_engine.hpp"

namespace engine {

// Knows how to create an engine for each supported language, and whether that
// engine can be used on this host. Engines become ready asynchronously after
// Init, once a probe run succeeds, and stop being available after Shutdown.
class EngineRegistry {
 public:
  using Factory = std::function<std::unique_ptr<ExecutionEngine>()>;

  struct EngineStatus {
    proto::Language language = proto::INVALID_LANGUAGE;
    std::string name;
    bool ready = false;
    // Why the engine is not ready, empty while probing.
    std::string error;
  };

  EngineRegistry() = default;
  ~EngineRegistry();

  // Registry with the Python, JavaScript and TypeScript engines, using the
  // interpreters given by --python_interpreter and --node_interpreter.
  static std::unique_ptr<EngineRegistry> WithDefaultEngines();

  // Adds an engine. Must be called before Init.
  void Register(proto::Language language, Factory factory);

  // Starts probing all the engines in background and returns immediately.
  void Init();

  // Waits until all the engines have been probed. Returns false on timeout.
  bool WaitUntilReady(std::chrono::milliseconds timeout);

  bool IsReady(proto::Language language) const;
  std::vector<EngineStatus> Status() const;

  // Returns a new engine instance. Throws engine_error if the language is not
  // supported or its engine is not ready.
  std::unique_ptr<ExecutionEngine> Create(proto::Language language) const;

  // Makes all engines unavailable and waits for probing to stop.
  void Shutdown();

  EngineRegistry(const EngineRegistry&) = delete;
  EngineRegistry& operator=(const EngineRegistry&) = delete;

 private:
  struct Entry {
    Factory factory;
    std::string name;
    bool probed = false;
    bool ready = false;
    std::string error;
  };

  void ProbeAll();

  mutable absl::Mutex mutex_;
  std::map<proto::Language, Entry> engines_ GUARDED_BY(mutex_);
  bool init_called_ GUARDED_BY(mutex_) = false;
  bool probing_done_ GUARDED_BY(mutex_) = false;
  bool shutdown_ GUARDED_BY(mutex_) = false;
  std::thread prober_;
};

}  // namespace engine

#endif
