#include "engine/javascript_engine.hpp"

#include <stdio.h>

#include <algorithm>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace engine {

// Smallest heap V8 accepts without failing at startup.
static const constexpr int64_t kMinHeapMb = 16;

std::string JavaScriptEngine::Quote(const std::string& s) {
  std::string quoted = "\"";
  for (unsigned char c : s) {
    switch (c) {
      case '"':
        quoted += "\\\"";
        break;
      case '\\':
        quoted += "\\\\";
        break;
      case '\n':
        quoted += "\\n";
        break;
      case '\r':
        quoted += "\\r";
        break;
      case '\t':
        quoted += "\\t";
        break;
      default:
        if (c < 0x20 || c == 0x7f) {
          char buf[8];
          snprintf(buf, sizeof(buf), "\\u%04x", c);
          quoted += buf;
        } else {
          quoted += static_cast<char>(c);
        }
    }
  }
  quoted += "\"";
  return quoted;
}

std::vector<std::string> JavaScriptEngine::RuntimeFlags(
    const ExecutionContext& context) const {
  std::vector<std::string> flags = {"--disallow-code-generation-from-strings",
                                    "--no-warnings"};
  if (context.limits.max_memory_mb() > 0) {
    flags.push_back(absl::StrCat(
        "--max-old-space-size=",
        std::max(kMinHeapMb, context.limits.max_memory_mb())));
  }
  return flags;
}

std::vector<std::string> JavaScriptEngine::Arguments(
    const std::string& source, const ExecutionContext& context) const {
  std::vector<std::string> args = RuntimeFlags(context);
  args.push_back(source);
  return args;
}

std::vector<std::string> JavaScriptEngine::ProbeArguments() const {
  return {"-e", "0"};
}

// The prelude takes a single line, so that line numbers in stack traces are
// off by exactly one.
std::string JavaScriptEngine::PrepareSource(
    const std::string& code, const std::vector<std::string>& inputs) const {
  std::vector<std::string> quoted;
  for (const std::string& input : inputs) quoted.push_back(Quote(input));
  return absl::StrCat(
      "globalThis.prompt = ((inputs) => () => inputs.length ? inputs.shift() "
      ": null)([",
      absl::StrJoin(quoted, ","), "]);\n", code);
}

}  // namespace engine
