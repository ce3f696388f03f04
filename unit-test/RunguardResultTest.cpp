#include <filesystem>
#include "common/io_utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "runguard.hpp"

using namespace std;
using namespace tci;
namespace fs = std::filesystem;

TEST(RunguardResultTest, ParsesMetaFile) {
    fs::path meta = SANDBOX_DIR / "runguard-result.meta";
    write_file_content(meta,
                       "memory-bytes: 1048576\n"
                       "time-used: wall-time\n"
                       "wall-time: 0.532\n"
                       "cpu-time: 0.410\n"
                       "exitcode: 0\n"
                       "stdout-bytes: 12\n"
                       "stderr-bytes: 0\n"
                       "output-truncated: stdout\n");

    runguard_result result = read_runguard_result(meta);
    EXPECT_EQ(result.memory, 1048576);
    EXPECT_DOUBLE_EQ(result.wall_time, 0.532);
    EXPECT_DOUBLE_EQ(result.cpu_time, 0.410);
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.signal, -1);
    EXPECT_EQ(result.stdout_bytes, 12);
    EXPECT_EQ(result.output_truncated, "stdout");
    EXPECT_TRUE(result.time_kind.empty());
    EXPECT_TRUE(result.violation.empty());
    fs::remove(meta);
}

TEST(RunguardResultTest, ParsesKilledProcess) {
    fs::path meta = SANDBOX_DIR / "runguard-killed.meta";
    write_file_content(meta,
                       "exitcode: 159\n"
                       "signal: 31\n"
                       "violation: syscall\n"
                       "time-result: hard-timelimit\n"
                       "time-kind: wall\n"
                       "memory-result: oom\n"
                       "internal-error: \n");

    runguard_result result = read_runguard_result(meta);
    EXPECT_EQ(result.exitcode, 159);
    EXPECT_EQ(result.signal, 31);
    EXPECT_EQ(result.violation, "syscall");
    EXPECT_EQ(result.time_result, "hard-timelimit");
    EXPECT_EQ(result.time_kind, "wall");
    EXPECT_EQ(result.memory_result, "oom");
    EXPECT_TRUE(result.internal_error.empty());
    fs::remove(meta);
}

TEST(RunguardResultTest, ParsesRejectedConnection) {
    fs::path meta = SANDBOX_DIR / "runguard-network.meta";
    write_file_content(meta,
                       "exitcode: 1\n"
                       "violation: network\n"
                       "memory-result: \n");

    runguard_result result = read_runguard_result(meta);
    EXPECT_EQ(result.exitcode, 1);
    EXPECT_EQ(result.signal, -1);
    EXPECT_EQ(result.violation, "network");
    EXPECT_TRUE(result.memory_result.empty());
    fs::remove(meta);
}

TEST(RunguardResultTest, MalformedValuesKeepDefaults) {
    fs::path meta = SANDBOX_DIR / "runguard-malformed.meta";
    write_file_content(meta, "exitcode: abc\nno separator here\ncpu-time:\n");

    runguard_result result = read_runguard_result(meta);
    EXPECT_EQ(result.exitcode, -1);
    EXPECT_DOUBLE_EQ(result.cpu_time, -1);
    fs::remove(meta);

    runguard_result missing = read_runguard_result(SANDBOX_DIR / "runguard-missing.meta");
    EXPECT_EQ(missing.exitcode, -1);
}
