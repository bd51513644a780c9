#ifndef ENGINE_PYTHON_ENGINE_HPP
#define ENGINE_PYTHON_ENGINE_HPP

#include "engine/interpreter_engine.hpp"

namespace engine {

// Runs Python 3 code in isolated mode (no user site, no environment
// variables, no bytecode files).
class PythonEngine : public InterpreterEngine {
 public:
  using InterpreterEngine::InterpreterEngine;
  proto::Language GetLanguage() const override { return proto::PYTHON; }
  std::string Name() const override { return "Python"; }

 protected:
  std::string SourceName() const override { return "main.py"; }
  std::vector<std::string> Arguments(
      const std::string& source,
      const ExecutionContext& context) const override;
  std::vector<std::string> ProbeArguments() const override;
  std::vector<std::string> Environment(const std::string& box) const override;
};

}  // namespace engine

#endif
