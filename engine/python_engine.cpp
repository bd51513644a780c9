#include "engine/python_engine.hpp"

namespace engine {

std::vector<std::string> PythonEngine::Arguments(
    const std::string& source, const ExecutionContext& context) const {
  return {"-I", "-B", "-u", source};
}

std::vector<std::string> PythonEngine::ProbeArguments() const {
  return {"-I", "-c", "pass"};
}

std::vector<std::string> PythonEngine::Environment(
    const std::string& box) const {
  std::vector<std::string> env = InterpreterEngine::Environment(box);
  env.push_back("PYTHONIOENCODING=utf-8");
  return env;
}

}  // namespace engine
