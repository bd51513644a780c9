#include "engine/execution_engine.hpp"

#include "engine/javascript_engine.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::HasSubstr;

class CountingEngine : public engine::ExecutionEngine {
 public:
  proto::Language GetLanguage() const override { return proto::PYTHON; }
  std::string Name() const override { return "Counting"; }
  engine::RawCounters Sample() const override { return {}; }
  void Release() override {}
  int runs = 0;

 protected:
  engine::EngineOutput DoExecute(
      const std::string& code, const std::vector<std::string>& inputs,
      const engine::ExecutionContext& context) override {
    runs++;
    engine::EngineOutput output;
    output.output = code;
    return output;
  }
};

TEST(ExecutionEngine, SingleUse) {
  CountingEngine engine;
  engine::ExecutionContext context;
  EXPECT_EQ(engine.Execute("x", {}, context).output, "x");
  try {
    engine.Execute("y", {}, context);
    FAIL() << "second execution did not throw";
  } catch (const engine::engine_error& e) {
    EXPECT_THAT(e.what(), HasSubstr("only be used once"));
  }
  EXPECT_EQ(engine.runs, 1);
}

TEST(ContentSecurityPolicy, DenyByDefault) {
  engine::Capabilities capabilities = engine::ParseContentSecurityPolicy("");
  EXPECT_FALSE(capabilities.network);
  EXPECT_FALSE(capabilities.filesystem);
  capabilities = engine::ParseContentSecurityPolicy(
      "default-src 'none'; script-src 'unsafe-inline'; style-src "
      "'unsafe-inline'; connect-src 'none'");
  EXPECT_FALSE(capabilities.network);
  EXPECT_FALSE(capabilities.filesystem);
}

TEST(ContentSecurityPolicy, Grants) {
  engine::Capabilities capabilities = engine::ParseContentSecurityPolicy(
      "default-src 'none'; connect-src 'self'; file-src 'none'");
  EXPECT_TRUE(capabilities.network);
  EXPECT_FALSE(capabilities.filesystem);
  capabilities =
      engine::ParseContentSecurityPolicy("default-src 'none';file-src 'self'");
  EXPECT_FALSE(capabilities.network);
  EXPECT_TRUE(capabilities.filesystem);
}

TEST(ContentSecurityPolicy, FallbackAndOverrides) {
  engine::Capabilities capabilities =
      engine::ParseContentSecurityPolicy("default-src 'self'");
  EXPECT_TRUE(capabilities.network);
  EXPECT_TRUE(capabilities.filesystem);
  capabilities = engine::ParseContentSecurityPolicy(
      "default-src 'self'; connect-src 'self' 'none'");
  EXPECT_FALSE(capabilities.network);
  capabilities = engine::ParseContentSecurityPolicy(
      "connect-src 'none'; connect-src 'self'");
  EXPECT_FALSE(capabilities.network);
}

TEST(ExecutionEngine, LanguageName) {
  EXPECT_EQ(engine::LanguageName(proto::PYTHON), "python");
  EXPECT_EQ(engine::LanguageName(proto::TYPESCRIPT), "typescript");
}

TEST(JavaScriptEngine, Quote) {
  EXPECT_EQ(engine::JavaScriptEngine::Quote("abc"), "\"abc\"");
  EXPECT_EQ(engine::JavaScriptEngine::Quote("a\"b\\c\n"),
            "\"a\\\"b\\\\c\\n\"");
  EXPECT_EQ(engine::JavaScriptEngine::Quote(std::string("\x01", 1)),
            "\"\\u0001\"");
  EXPECT_EQ(engine::JavaScriptEngine::Quote("\xc3\xa8"), "\"\xc3\xa8\"");
}

}  // namespace
