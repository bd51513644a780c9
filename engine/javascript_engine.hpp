#ifndef ENGINE_JAVASCRIPT_ENGINE_HPP
#define ENGINE_JAVASCRIPT_ENGINE_HPP

#include "engine/interpreter_engine.hpp"

namespace engine {

// Runs JavaScript code with Node.js. Code generation from strings (eval, new
// Function) is disabled in the runtime, and prompt() returns the inputs in
// order.
class JavaScriptEngine : public InterpreterEngine {
 public:
  using InterpreterEngine::InterpreterEngine;
  proto::Language GetLanguage() const override { return proto::JAVASCRIPT; }
  std::string Name() const override { return "JavaScript"; }

  // Returns s as a JavaScript string literal.
  static std::string Quote(const std::string& s);

 protected:
  std::string SourceName() const override { return "main.js"; }
  std::vector<std::string> Arguments(
      const std::string& source,
      const ExecutionContext& context) const override;
  std::vector<std::string> ProbeArguments() const override;
  std::string PrepareSource(
      const std::string& code,
      const std::vector<std::string>& inputs) const override;

  // Flags shared by all the Node.js based engines.
  std::vector<std::string> RuntimeFlags(const ExecutionContext& context) const;
};

}  // namespace engine

#endif
