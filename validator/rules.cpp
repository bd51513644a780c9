#include "validator/rules.hpp"

#include <stdexcept>
#include <utility>

#include "absl/memory/memory.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "glog/logging.h"

namespace validator {
namespace {

using proto::RiskLevel;

bool NameMatches(const std::string& rule_name, const std::string& name) {
  if (absl::EndsWith(rule_name, "*")) {
    return absl::StartsWith(name, rule_name.substr(0, rule_name.size() - 1));
  }
  if (name == rule_name) return true;
  return name.size() > rule_name.size() && absl::StartsWith(name, rule_name) &&
         (name[rule_name.size()] == '.' || name[rule_name.size()] == '/');
}

// Patterns that are dangerous in any language.
void AddCommonPatterns(std::vector<PatternRule>* rules) {
  rules->emplace_back(
      "recursive-delete", "Recursive deletion", RiskLevel::CRITICAL,
      Capability::NONE,
      R"(\brm\s+-[a-zA-Z]*[rR][a-zA-Z]*\s+(?:-[a-zA-Z-]+\s+)*(?:/|~|\*))",
      "Recursive deletion of system paths is not allowed",
      "Remove destructive shell commands");
  rules->emplace_back(
      "raw-device-access", "Raw device access", RiskLevel::CRITICAL,
      Capability::NONE,
      R"(/dev/(?:sd[a-z]|hd[a-z]|nvme\d|mem\b|kmem\b|port\b)|\bdd\s+if=|\bmkfs(?:\.\w+)?\b)",
      "Writing to raw devices can destroy data",
      "Remove destructive shell commands");
  rules->emplace_back(
      "fork-bomb", "Fork bomb", RiskLevel::CRITICAL, Capability::NONE,
      R"(:\s*\(\s*\)\s*\{\s*:\s*\|\s*:\s*&\s*\}\s*;\s*:)",
      "Fork bombs exhaust the process table", "");
  rules->emplace_back(
      "privilege-escalation", "Privilege escalation", RiskLevel::CRITICAL,
      Capability::NONE,
      R"(\bsudo\b|\bsu\s+-|\bchmod\s+(?:-R\s+)?0?777\b|\bchown\s+root\b|\bsetuid\s*\()",
      "Privilege escalation is not allowed", "");
  rules->emplace_back(
      "system-files", "System file access", RiskLevel::HIGH, Capability::NONE,
      R"(/etc/(?:passwd|shadow|sudoers)|/proc/(?:self|\d+)/|/root/)",
      "Access to sensitive system files is not allowed", "");
  rules->emplace_back("crypto-mining", "Cryptocurrency mining",
                      RiskLevel::HIGH, Capability::NONE,
                      R"(stratum\+tcp|\bxmrig\b|\bcoinhive\b|\bcryptonight\b)",
                      "Cryptocurrency mining is not allowed", "", true);
  rules->emplace_back("path-traversal", "Path traversal", RiskLevel::MEDIUM,
                      Capability::NONE, R"(\.\./\.\./)",
                      "Path traversal sequences reach outside the sandbox",
                      "Use relative paths inside the working directory");
  rules->emplace_back(
      "hardcoded-secret", "Hard-coded secret", RiskLevel::LOW,
      Capability::NONE,
      R"((?:password|passwd|secret|api[_-]?key|token)\s*[:=]\s*["'][^"']{4,}["'])",
      "The code seems to contain a credential",
      "Remove sensitive data before execution", true);
}

RuleSet PythonRules() {
  RuleSet rules;
  rules.structural = {
      {"py-dynamic-eval", "Dynamic code execution", RiskLevel::CRITICAL,
       Capability::NONE, NodeKind::CALL,
       {"eval", "exec", "builtins.eval", "builtins.exec"},
       "eval() and exec() can execute arbitrary code",
       "Use ast.literal_eval() to parse literal values"},
      {"py-dynamic-import", "Dynamic import", RiskLevel::CRITICAL,
       Capability::NONE, NodeKind::CALL,
       {"__import__", "importlib.import_module", "importlib.__import__"},
       "Dynamic imports can load any module",
       "Use import statements at the top of the code"},
      {"py-compile", "Runtime compilation", RiskLevel::HIGH, Capability::NONE,
       NodeKind::CALL, {"compile"},
       "Compiling code at runtime can execute arbitrary code", ""},
      {"py-process-module", "Process creation", RiskLevel::CRITICAL,
       Capability::NONE, NodeKind::IMPORT,
       {"subprocess", "pty", "multiprocessing", "pexpect", "commands"},
       "Creating processes is not allowed",
       "Use Python functions instead of external commands"},
      {"py-os-command", "System command", RiskLevel::CRITICAL,
       Capability::NONE, NodeKind::CALL,
       {"os.system", "os.popen", "os.exec*", "os.spawn*", "os.posix_spawn*",
        "os.fork", "os.forkpty", "os.kill", "os.killpg", "posix.system"},
       "Running system commands can compromise the host",
       "Use Python functions instead of external commands"},
      {"py-native-code", "Native code", RiskLevel::CRITICAL, Capability::NONE,
       NodeKind::IMPORT, {"ctypes", "cffi"},
       "Native code access escapes the interpreter", ""},
      {"py-file-access", "File access", RiskLevel::HIGH,
       Capability::FILESYSTEM, NodeKind::CALL,
       {"open", "io.open", "os.open", "os.remove", "os.unlink", "os.rmdir",
        "os.removedirs", "os.mkdir", "os.makedirs", "os.rename", "os.renames",
        "os.replace", "os.truncate", "os.ftruncate", "os.link", "os.symlink",
        "os.mkfifo", "os.mknod", "os.chmod", "os.chown", "os.utime",
        "os.listdir", "os.scandir", "os.walk", "shutil.*", "pathlib.*"},
       "File system access is not allowed in this environment",
       "Use in-memory data structures instead of files"},
      {"py-filesystem-module", "File system module", RiskLevel::HIGH,
       Capability::FILESYSTEM, NodeKind::IMPORT,
       {"shutil", "pathlib", "tempfile", "glob"},
       "File system access is not allowed in this environment",
       "Use in-memory data structures instead of files"},
      {"py-network-module", "Network access", RiskLevel::HIGH,
       Capability::NETWORK, NodeKind::IMPORT,
       {"socket", "ssl", "urllib", "urllib2", "http", "requests", "httpx",
        "aiohttp", "ftplib", "smtplib", "poplib", "imaplib", "telnetlib",
        "xmlrpc", "websocket", "websockets"},
       "Network access is not allowed in this environment",
       "Use the provided inputs instead of fetching data"},
      {"py-interpreter-internals", "Interpreter internals", RiskLevel::HIGH,
       Capability::NONE, NodeKind::ATTRIBUTE,
       {"__subclasses__", "__globals__", "__builtins__", "__code__",
        "__bases__", "__base__", "__mro__", "__getattribute__", "__closure__",
        "__loader__", "f_globals", "f_locals", "f_back", "gi_frame",
        "tb_frame"},
       "Introspection of interpreter internals can escape the sandbox", ""},
      {"py-builtins", "Interpreter internals", RiskLevel::HIGH,
       Capability::NONE, NodeKind::NAME, {"__builtins__", "__loader__"},
       "Introspection of interpreter internals can escape the sandbox", ""},
      {"py-os-module", "Operating system module", RiskLevel::MEDIUM,
       Capability::NONE, NodeKind::IMPORT, {"os", "posix"},
       "The module exposes the host environment", ""},
      {"py-reflection", "Dynamic attribute access", RiskLevel::MEDIUM,
       Capability::NONE, NodeKind::CALL,
       {"getattr", "setattr", "delattr", "globals", "locals", "vars"},
       "Dynamic attribute access makes code hard to analyze",
       "Access attributes directly"},
      {"py-infinite-loop", "Infinite loop", RiskLevel::MEDIUM,
       Capability::NONE, NodeKind::LOOP, {},
       "Loop condition is always true and the loop never exits",
       "Add a break condition or use a bounded loop"},
  };
  AddCommonPatterns(&rules.patterns);
  rules.patterns.emplace_back(
      "py-shell-true", "Shell execution", RiskLevel::HIGH, Capability::NONE,
      R"(\bshell\s*=\s*True\b)", "Shell execution enables command injection",
      "Pass the command as a list of arguments");
  rules.patterns.emplace_back(
      "py-unsafe-deserialization", "Unsafe deserialization",
      RiskLevel::MEDIUM, Capability::NONE,
      R"(\b(?:pickle|marshal|shelve|dill)\.loads?\s*\()",
      "Deserializing untrusted data can execute code", "Use json instead");
  rules.patterns.emplace_back(
      "py-large-range", "Large iteration", RiskLevel::MEDIUM,
      Capability::NONE, R"(\brange\s*\(\s*\d{8,})",
      "Very large ranges may exceed the time limit",
      "Use smaller ranges or generators");
  rules.patterns.emplace_back(
      "py-large-allocation", "Large allocation", RiskLevel::MEDIUM,
      Capability::NONE, R"(\*\s*(?:\d{8,}|10\s*\*\*\s*(?:[89]|\d{2,})))",
      "Very large allocations may exceed the memory limit",
      "Process data in smaller chunks");
  return rules;
}

RuleSet JavaScriptRules() {
  RuleSet rules;
  rules.structural = {
      {"js-eval", "Dynamic code execution", RiskLevel::CRITICAL,
       Capability::NONE, NodeKind::CALL,
       {"eval", "window.eval", "globalThis.eval", "global.eval"},
       "eval() can execute arbitrary code",
       "Use JSON.parse() for data and plain functions for logic"},
      {"js-function-constructor", "Function constructor", RiskLevel::CRITICAL,
       Capability::NONE, NodeKind::NEW,
       {"Function", "AsyncFunction", "GeneratorFunction"},
       "The Function constructor can execute arbitrary code",
       "Use plain functions instead"},
      {"js-function-call", "Function constructor", RiskLevel::CRITICAL,
       Capability::NONE, NodeKind::CALL, {"Function"},
       "The Function constructor can execute arbitrary code",
       "Use plain functions instead"},
      {"js-process-module", "Process creation", RiskLevel::CRITICAL,
       Capability::NONE, NodeKind::IMPORT,
       {"child_process", "worker_threads", "cluster", "vm", "v8",
        "inspector", "module"},
       "Creating processes or isolates is not allowed", ""},
      {"js-dynamic-import", "Dynamic import", RiskLevel::HIGH,
       Capability::NONE, NodeKind::IMPORT, {"<dynamic>"},
       "Imports with computed module names cannot be checked",
       "Import modules by name"},
      {"js-process-object", "Process object", RiskLevel::HIGH,
       Capability::NONE, NodeKind::NAME, {"process", "Deno", "Bun"},
       "The process object exposes the host environment",
       "Use prompt() to read inputs"},
      {"js-filesystem-module", "File system module", RiskLevel::HIGH,
       Capability::FILESYSTEM, NodeKind::IMPORT, {"fs"},
       "File system access is not allowed in this environment",
       "Use in-memory data structures instead of files"},
      {"js-network-module", "Network access", RiskLevel::HIGH,
       Capability::NETWORK, NodeKind::IMPORT,
       {"net", "http", "https", "http2", "dgram", "tls", "dns", "undici",
        "axios", "node-fetch", "ws"},
       "Network access is not allowed in this environment",
       "Use the provided inputs instead of fetching data"},
      {"js-fetch", "Network access", RiskLevel::HIGH, Capability::NETWORK,
       NodeKind::CALL, {"fetch", "window.fetch", "globalThis.fetch"},
       "Network access is not allowed in this environment",
       "Use the provided inputs instead of fetching data"},
      {"js-network-object", "Network access", RiskLevel::HIGH,
       Capability::NETWORK, NodeKind::NEW,
       {"XMLHttpRequest", "WebSocket", "EventSource"},
       "Network access is not allowed in this environment",
       "Use the provided inputs instead of fetching data"},
      {"js-prototype-pollution", "Prototype manipulation", RiskLevel::HIGH,
       Capability::NONE, NodeKind::ATTRIBUTE,
       {"__proto__", "__defineGetter__", "__defineSetter__",
        "__lookupGetter__", "__lookupSetter__"},
       "Prototype manipulation can escape the sandbox", ""},
      {"js-global-object", "Global object access", RiskLevel::MEDIUM,
       Capability::NONE, NodeKind::NAME,
       {"globalThis", "global", "window", "document"},
       "Access to the global object makes code hard to analyze", ""},
      {"js-reflection", "Reflection", RiskLevel::MEDIUM, Capability::NONE,
       NodeKind::NAME, {"Reflect", "Proxy"},
       "Reflection makes code hard to analyze", ""},
      {"js-infinite-loop", "Infinite loop", RiskLevel::MEDIUM,
       Capability::NONE, NodeKind::LOOP, {},
       "Loop condition is always true and the loop never exits",
       "Add a break condition or use a bounded loop"},
  };
  AddCommonPatterns(&rules.patterns);
  rules.patterns.emplace_back(
      "js-constructor-chain", "Constructor escape", RiskLevel::CRITICAL,
      Capability::NONE,
      R"(constructor["'`]?\s*\]?\s*(?:\.|\[\s*["'`])\s*constructor)",
      "Chained constructor access reaches the Function constructor", "");
  rules.patterns.emplace_back(
      "js-string-timer", "Timer with code string", RiskLevel::HIGH,
      Capability::NONE, R"(\bset(?:Timeout|Interval|Immediate)\s*\(\s*["'`])",
      "Timers with string arguments evaluate code",
      "Pass a function to the timer");
  rules.patterns.emplace_back(
      "js-large-array", "Large allocation", RiskLevel::MEDIUM,
      Capability::NONE, R"(\bnew\s+Array\s*\(\s*\d{8,})",
      "Very large arrays may exceed the memory limit",
      "Process data in smaller chunks");
  rules.patterns.emplace_back(
      "js-inner-html", "Markup injection", RiskLevel::MEDIUM,
      Capability::NONE, R"(\.(?:innerHTML|outerHTML)\s*=)",
      "Assigning markup can inject scripts", "Use textContent instead");
  return rules;
}

re2::RE2::Options PatternOptions(bool ignore_case) {
  re2::RE2::Options options;
  options.set_case_sensitive(!ignore_case);
  options.set_log_errors(false);
  return options;
}

}  // namespace

bool StructuralRule::Matches(const SyntaxNode& node) const {
  if (node.kind != kind) return false;
  if (kind == NodeKind::LOOP) return node.infinite && !node.exits;
  for (const std::string& n : names) {
    if (NameMatches(n, node.name)) return true;
  }
  return false;
}

PatternRule::PatternRule(std::string id, std::string name,
                         proto::RiskLevel severity, Capability capability,
                         const std::string& pattern, std::string message,
                         std::string suggestion, bool ignore_case)
    : id(std::move(id)),
      name(std::move(name)),
      severity(severity),
      capability(capability),
      pattern(
          absl::make_unique<re2::RE2>(pattern, PatternOptions(ignore_case))),
      message(std::move(message)),
      suggestion(std::move(suggestion)) {
  CHECK(this->pattern->ok()) << this->id << ": " << this->pattern->error();
}

const RuleSet& RulesFor(proto::Language language) {
  static const RuleSet python = PythonRules();
  static const RuleSet javascript = JavaScriptRules();
  switch (language) {
    case proto::Language::PYTHON:
      return python;
    case proto::Language::JAVASCRIPT:
    case proto::Language::TYPESCRIPT:
      return javascript;
    default:
      throw std::invalid_argument(
          absl::StrCat("Unsupported language: ",
                       proto::Language_Name(language)));
  }
}

}  // namespace validator
