#ifndef ENGINE_TYPESCRIPT_ENGINE_HPP
#define ENGINE_TYPESCRIPT_ENGINE_HPP

#include "engine/javascript_engine.hpp"

namespace engine {

// Runs TypeScript code with the type stripping of Node.js (22.6 or newer).
// Only erasable syntax is supported, type checking is not performed.
class TypeScriptEngine : public JavaScriptEngine {
 public:
  using JavaScriptEngine::JavaScriptEngine;
  proto::Language GetLanguage() const override { return proto::TYPESCRIPT; }
  std::string Name() const override { return "TypeScript"; }
  bool Probe(std::string* error_msg) override;

 protected:
  std::string SourceName() const override { return "main.ts"; }
  std::vector<std::string> Arguments(
      const std::string& source,
      const ExecutionContext& context) const override;
  std::vector<std::string> ProbeArguments() const override;
};

}  // namespace engine

#endif
