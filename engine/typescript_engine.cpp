#include "engine/typescript_engine.hpp"

namespace engine {

bool TypeScriptEngine::Probe(std::string* error_msg) {
  if (JavaScriptEngine::Probe(error_msg)) return true;
  *error_msg += " (TypeScript needs Node.js 22.6 or newer)";
  return false;
}

std::vector<std::string> TypeScriptEngine::Arguments(
    const std::string& source, const ExecutionContext& context) const {
  std::vector<std::string> args = RuntimeFlags(context);
  args.push_back("--experimental-strip-types");
  args.push_back(source);
  return args;
}

std::vector<std::string> TypeScriptEngine::ProbeArguments() const {
  return {"--no-warnings", "--experimental-strip-types", "-e", "0"};
}

}  // namespace engine
