#include "manager/limits.hpp"

#include "engine/execution_engine.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "manager/content_security_policy.hpp"

namespace {

TEST(Limits, ApplyDefaults) {
  proto::ResourceLimits limits;
  limits.set_max_cpu_time_ms(700);
  limits.set_enable_network_access(true);
  proto::ResourceLimits result = manager::ApplyDefaults(limits);
  EXPECT_EQ(result.max_memory_mb(), 32);
  EXPECT_EQ(result.max_execution_time_ms(), 10000);
  EXPECT_EQ(result.max_cpu_time_ms(), 700);
  EXPECT_EQ(result.max_output_size(), 10 * 1024 * 1024);
  EXPECT_TRUE(result.enable_network_access());
  EXPECT_FALSE(result.enable_file_system_access());
}

TEST(Limits, Caps) {
  std::string error;
  proto::ResourceLimits limits = manager::ApplyDefaults({});
  EXPECT_TRUE(manager::CheckLimits(limits, &error));

  limits.set_max_memory_mb(65);
  EXPECT_FALSE(manager::CheckLimits(limits, &error));
  EXPECT_EQ(error, "Memory limit cannot exceed 64MB");

  limits.set_max_memory_mb(64);
  limits.set_max_cpu_time_ms(10001);
  EXPECT_FALSE(manager::CheckLimits(limits, &error));
  EXPECT_EQ(error, "CPU time limit cannot exceed 10000ms");

  limits.set_max_cpu_time_ms(-1);
  EXPECT_FALSE(manager::CheckLimits(limits, &error));
  EXPECT_EQ(error, "CPU time limit cannot be negative");

  limits.set_max_cpu_time_ms(1);
  limits.set_max_execution_time_ms(30001);
  EXPECT_FALSE(manager::CheckLimits(limits, &error));
  EXPECT_EQ(error, "Execution time limit cannot exceed 30000ms");
}

TEST(ContentSecurityPolicy, DenyByDefault) {
  std::string policy = manager::BuildContentSecurityPolicy({});
  EXPECT_EQ(policy,
            "default-src 'none'; script-src 'unsafe-inline'; "
            "style-src 'unsafe-inline'; connect-src 'none'; file-src 'none'");
  engine::Capabilities capabilities =
      engine::ParseContentSecurityPolicy(policy);
  EXPECT_FALSE(capabilities.network);
  EXPECT_FALSE(capabilities.filesystem);
}

TEST(ContentSecurityPolicy, GrantedCapabilities) {
  proto::ResourceLimits limits;
  limits.set_enable_network_access(true);
  std::string policy = manager::BuildContentSecurityPolicy(limits);
  EXPECT_THAT(policy, ::testing::HasSubstr("connect-src 'self'"));
  engine::Capabilities capabilities =
      engine::ParseContentSecurityPolicy(policy);
  EXPECT_TRUE(capabilities.network);
  EXPECT_FALSE(capabilities.filesystem);

  limits.set_enable_network_access(false);
  limits.set_enable_file_system_access(true);
  capabilities = engine::ParseContentSecurityPolicy(
      manager::BuildContentSecurityPolicy(limits));
  EXPECT_FALSE(capabilities.network);
  EXPECT_TRUE(capabilities.filesystem);
}

}  // namespace
