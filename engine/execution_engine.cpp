#include "engine/execution_engine.hpp"

#include <map>

#include "absl/strings/ascii.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"

namespace engine {

EngineOutput ExecutionEngine::Execute(const std::string& code,
                                      const std::vector<std::string>& inputs,
                                      const ExecutionContext& context) {
  if (used_.exchange(true)) {
    throw engine_error(Name() + " engine instances can only be used once");
  }
  return DoExecute(code, inputs, context);
}

Capabilities ParseContentSecurityPolicy(const std::string& policy) {
  std::map<std::string, std::vector<std::string>> directives;
  for (absl::string_view directive :
       absl::StrSplit(policy, ';', absl::SkipWhitespace())) {
    std::vector<std::string> tokens =
        absl::StrSplit(directive, absl::ByAnyChar(" \t\n"), absl::SkipEmpty());
    if (tokens.empty()) continue;
    std::string name = absl::AsciiStrToLower(tokens[0]);
    // The first occurrence of a directive wins.
    if (directives.count(name)) continue;
    directives[name].assign(tokens.begin() + 1, tokens.end());
  }
  auto allows_self = [&directives](const std::string& name) {
    auto it = directives.find(name);
    if (it == directives.end()) it = directives.find("default-src");
    if (it == directives.end()) return false;
    bool allowed = false;
    for (const std::string& source : it->second) {
      if (source == "'none'") return false;
      if (source == "'self'" || source == "*") allowed = true;
    }
    return allowed;
  };
  Capabilities capabilities;
  capabilities.network = allows_self("connect-src");
  capabilities.filesystem = allows_self("file-src");
  return capabilities;
}

std::string LanguageName(proto::Language language) {
  return absl::AsciiStrToLower(proto::Language_Name(language));
}

}  // namespace engine
