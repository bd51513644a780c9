#include "engine/javascript_engine.hpp"

#include <memory>

#include "absl/memory/memory.h"
#include "engine/typescript_engine.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/which.hpp"

namespace {

using ::testing::HasSubstr;

const std::string test_tmpdir = "/tmp/snipbox_testdir";

engine::ExecutionContext Context() {
  engine::ExecutionContext context;
  context.temp_directory = test_tmpdir;
  context.content_security_policy = "default-src 'none'";
  context.limits.set_max_memory_mb(32);
  context.limits.set_max_execution_time_ms(10000);
  context.limits.set_max_cpu_time_ms(5000);
  context.limits.set_max_output_size(1024 * 1024);
  return context;
}

template <typename Engine>
class NodeEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    engine_ = absl::make_unique<Engine>(util::which("node"));
    std::string error;
    if (!Engine(util::which("node")).Probe(&error)) GTEST_SKIP() << error;
  }
  std::unique_ptr<Engine> engine_;
};

using JavaScriptEngineTest = NodeEngineTest<engine::JavaScriptEngine>;
using TypeScriptEngineTest = NodeEngineTest<engine::TypeScriptEngine>;

TEST_F(JavaScriptEngineTest, Hello) {
  engine::EngineOutput output =
      engine_->Execute("console.log('hello');", {}, Context());
  EXPECT_EQ(output.output, "hello\n");
  EXPECT_EQ(output.exit_code, 0);
  EXPECT_EQ(output.termination, engine::Termination::NONE);
  EXPECT_LT(output.counters.peak_memory_kb, 16 * 1024);
}

TEST_F(JavaScriptEngineTest, MemoryLimit) {
  engine::EngineOutput output = engine_->Execute(
      "const chunks = [];\n"
      "for (;;) chunks.push(Buffer.alloc(1024 * 1024, 1));\n",
      {}, Context());
  EXPECT_EQ(output.termination, engine::Termination::MEMORY_LIMIT);
  EXPECT_EQ(output.termination_message, "Memory limit exceeded: 32MB");
}

TEST_F(JavaScriptEngineTest, Prompt) {
  engine::EngineOutput output = engine_->Execute(
      "const a = prompt(); const b = prompt(); const c = prompt();\n"
      "console.log(a + '|' + b + '|' + c);",
      {"first \"quoted\"", "second"}, Context());
  EXPECT_EQ(output.output, "first \"quoted\"|second|null\n");
}

TEST_F(JavaScriptEngineTest, CodeGenerationDisabled) {
  engine::EngineOutput output =
      engine_->Execute("console.log(eval('1 + 1'));", {}, Context());
  EXPECT_NE(output.exit_code, 0);
  EXPECT_THAT(output.error, HasSubstr("EvalError"));
}

TEST_F(JavaScriptEngineTest, UncaughtError) {
  engine::EngineOutput output =
      engine_->Execute("throw new Error('boom');", {}, Context());
  EXPECT_EQ(output.exit_code, 1);
  EXPECT_THAT(output.error, HasSubstr("boom"));
}

TEST_F(JavaScriptEngineTest, Timeout) {
  engine::ExecutionContext context = Context();
  context.limits.set_max_execution_time_ms(500);
  context.limits.set_max_cpu_time_ms(5000);
  engine::EngineOutput output = engine_->Execute("for (;;) {}", {}, context);
  EXPECT_EQ(output.termination, engine::Termination::WALL_DEADLINE);
}

TEST_F(TypeScriptEngineTest, Hello) {
  engine::EngineOutput output = engine_->Execute(
      "const name: string = 'hello';\nconsole.log(name);", {}, Context());
  EXPECT_EQ(output.output, "hello\n");
  EXPECT_EQ(output.exit_code, 0);
}

TEST(TypeScriptEngine, ProbeNamesTheRequiredRuntime) {
  engine::TypeScriptEngine engine("/bin/false");
  std::string error;
  EXPECT_FALSE(engine.Probe(&error));
  EXPECT_THAT(error, HasSubstr("Node.js 22.6 or newer"));
}

}  // namespace
