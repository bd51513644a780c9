#ifndef ENGINE_INTERPRETER_ENGINE_HPP
#define ENGINE_INTERPRETER_ENGINE_HPP

#include <memory>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "engine/execution_engine.hpp"
#include "sandbox/sandbox.hpp"

namespace engine {

// Engine that runs the code with an interpreter installed on the host, as a
// separate process inside a sandbox. The code is written to a fresh working
// directory and the inputs are fed on stdin, one per line. Memory is measured
// on top of what the interpreter uses for an empty program, as seen by Probe.
class InterpreterEngine : public ExecutionEngine {
 public:
  explicit InterpreterEngine(std::string interpreter)
      : interpreter_(std::move(interpreter)) {}

  bool Probe(std::string* error_msg) override;
  RawCounters Sample() const override;
  void Release() override;

  const std::string& Interpreter() const { return interpreter_; }

  static const constexpr char* kBoxDir = "box";
  static const constexpr int32_t kMaxFiles = 64;
  // Processes and threads of one execution.
  static const constexpr int32_t kMaxProcs = 64;

 protected:
  // Name of the file the code is written to.
  virtual std::string SourceName() const = 0;

  // Arguments of the interpreter to run the source file.
  virtual std::vector<std::string> Arguments(
      const std::string& source, const ExecutionContext& context) const = 0;

  // Arguments of the interpreter that run an empty program.
  virtual std::vector<std::string> ProbeArguments() const = 0;

  // Content of the source file.
  virtual std::string PrepareSource(
      const std::string& code, const std::vector<std::string>& inputs) const {
    return code;
  }

  // Environment of the interpreter.
  virtual std::vector<std::string> Environment(const std::string& box) const;

  EngineOutput DoExecute(const std::string& code,
                         const std::vector<std::string>& inputs,
                         const ExecutionContext& context) override;

 private:
  // Publishes the sandbox to Sample and Release, killing it right away if a
  // release was already requested.
  sandbox::Sandbox* Attach(std::unique_ptr<sandbox::Sandbox> sandbox,
                           int64_t baseline_kb);

  // Startup memory of the interpreter, probing it if it was never probed.
  // Throws engine_error if the probe fails.
  int64_t BaselineKb();
  std::string BaselineKey() const;

  std::string interpreter_;
  mutable absl::Mutex mutex_;
  std::unique_ptr<sandbox::Sandbox> sandbox_ GUARDED_BY(mutex_);
  bool released_ GUARDED_BY(mutex_) = false;
  int64_t baseline_kb_ GUARDED_BY(mutex_) = 0;
};

}  // namespace engine

#endif
