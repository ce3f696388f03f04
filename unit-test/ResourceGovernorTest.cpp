#include "common/exceptions.hpp"
#include "governor/resource_governor.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace tci;
using namespace nlohmann;

TEST(ResourceGovernorTest, AdmitUsesDefaultsForMissingFields) {
    resource_governor governor({});
    resource_profile profile = governor.admit(json{{"cpu_time", 2}, {"memory_limit", 65536}});
    EXPECT_DOUBLE_EQ(profile.cpu_time, 2);
    EXPECT_EQ(profile.memory_limit, 65536);
    EXPECT_DOUBLE_EQ(profile.wall_time, 30);
    EXPECT_EQ(profile.output_limit, 1 << 20);
    EXPECT_EQ(profile.proc_limit, 32);

    resource_profile defaults = governor.admit(json());
    EXPECT_DOUBLE_EQ(defaults.cpu_time, 10);
    EXPECT_EQ(defaults.memory_limit, 262144);
}

TEST(ResourceGovernorTest, AdmitClampsToHostMaximum) {
    resource_governor governor({});
    resource_profile profile = governor.admit(json{{"cpu_time", 1000}, {"memory_limit", 1LL << 40}, {"proc_limit", 100000}});
    EXPECT_DOUBLE_EQ(profile.cpu_time, 60);
    EXPECT_EQ(profile.memory_limit, 2097152);
    EXPECT_EQ(profile.proc_limit, 256);
}

TEST(ResourceGovernorTest, NonPositiveValuesMeanUnspecified) {
    resource_governor governor({});
    resource_profile profile = governor.admit(json{{"cpu_time", 0}, {"wall_time", -5}});
    EXPECT_DOUBLE_EQ(profile.cpu_time, 10);
    EXPECT_DOUBLE_EQ(profile.wall_time, 30);
}

TEST(ResourceGovernorTest, EffectiveWallTimeHonorsDeadline) {
    resource_governor governor({});
    resource_profile profile;
    profile.wall_time = 10;
    EXPECT_DOUBLE_EQ(governor.effective_wall_time(profile, nullopt), 10);
    EXPECT_DOUBLE_EQ(governor.effective_wall_time(profile, 2.5), 2.5);
    EXPECT_DOUBLE_EQ(governor.effective_wall_time(profile, 60), 10);
    EXPECT_DOUBLE_EQ(governor.effective_wall_time(profile, 0), 10);
}

TEST(ResourceGovernorTest, EvaluateReportsFirstExceededLimit) {
    resource_governor governor({});
    resource_profile profile;
    profile.cpu_time = 1;
    profile.memory_limit = 1024;
    profile.output_limit = 100;

    resource_usage usage;
    EXPECT_EQ(governor.evaluate(profile, usage), resource_verdict::WITHIN_LIMITS);

    usage.cpu_time = 1.5;
    EXPECT_EQ(governor.evaluate(profile, usage), resource_verdict::CPU_EXCEEDED);

    usage.memory_bytes = 2 * 1024 * 1024;
    EXPECT_EQ(governor.evaluate(profile, usage), resource_verdict::MEMORY_EXCEEDED);

    resource_usage oom;
    oom.oom = true;
    EXPECT_EQ(governor.evaluate(profile, oom), resource_verdict::MEMORY_EXCEEDED);

    resource_usage output;
    output.stderr_bytes = 101;
    EXPECT_EQ(governor.evaluate(profile, output), resource_verdict::OUTPUT_EXCEEDED);

    resource_usage xcpu;
    xcpu.cpu_killed = true;
    EXPECT_EQ(governor.evaluate(profile, xcpu), resource_verdict::CPU_EXCEEDED);
}

TEST(ResourceGovernorTest, AccountsArePerExecution) {
    resource_governor governor({});
    resource_profile profile;
    governor.begin("exec-1", "session-a", profile);
    governor.begin("exec-2", "session-a", profile);
    governor.begin("exec-3", "session-b", profile);
    EXPECT_EQ(governor.active(), 3u);
    EXPECT_EQ(governor.active("session-a"), 2u);
    EXPECT_THROW(governor.begin("exec-1", "session-b", profile), internal_error);

    resource_usage usage;
    usage.cpu_time = 0.5;
    usage.wall_time = 0.75;
    governor.record("exec-1", usage);
    resource_usage recorded = governor.end("exec-1");
    EXPECT_DOUBLE_EQ(recorded.cpu_time, 0.5);
    EXPECT_DOUBLE_EQ(recorded.wall_time, 0.75);
    EXPECT_EQ(governor.active("session-a"), 1u);

    // 没有记录使用量的执行按记账时长计算时钟时间
    EXPECT_GE(governor.end("exec-2").wall_time, 0);
    governor.end("exec-3");
    EXPECT_EQ(governor.active(), 0u);
}

TEST(ResourceGovernorTest, ReadsConfiguration) {
    auto config = json{{"defaults", {{"cpu_time", 3}}}, {"maximum", {{"cpu_time", 5}}}, {"grace_period", 0.5}}.get<governor_config>();
    resource_governor governor(config);
    EXPECT_DOUBLE_EQ(governor.admit(json()).cpu_time, 3);
    EXPECT_DOUBLE_EQ(governor.admit(json{{"cpu_time", 7}}).cpu_time, 5);
    EXPECT_DOUBLE_EQ(governor.grace_period(), 0.5);
}
