/**
 * @file UtilityFallbackAccessorTest.cpp
 * @brief Unit tests for the utility fallback access path
 */

#include "devices/UtilityFallbackAccessor.hpp"

#include "fixtures/TestFixtures.hpp"
#include "mocks/MockUtilityRunner.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <thread>

using testing::_;
using testing::ElementsAre;
using testing::Return;

class UtilityFallbackAccessorTest : public ::testing::Test {
protected:
    std::shared_ptr<MockUtilityRunner> runner = MockUtilityRunner::CreateDefault();
    DeviceInfo device{.id = "sdb", .path = "/dev/sdb", .capacity_bytes = 1'024 * 1'024};
    std::atomic<bool> cancel_flag{false};

    devices::UtilityFallbackAccessor MakeAccessor(std::vector<std::string> command = {
                                                      "blkdiscard", "--zeroout", "{path}"}) {
        return devices::UtilityFallbackAccessor(device, std::move(command), runner);
    }
};

// Test: the command template receives the device path
TEST_F(UtilityFallbackAccessorTest, Command_SubstitutesPath) {
    auto accessor = MakeAccessor({"wipe-tool", "--device={path}", "--also", "{path}"});

    EXPECT_THAT(accessor.command(),
                ElementsAre("wipe-tool", "--device=/dev/sdb", "--also", "/dev/sdb"));
}

// Test: capabilities describe a non-addressable fallback path
TEST_F(UtilityFallbackAccessorTest, DetectCapability_UtilityPresent_Fallback) {
    auto accessor = MakeAccessor();

    auto caps = accessor.detect_capability();

    ASSERT_TRUE(caps.has_value());
    EXPECT_EQ(caps->mode, AccessMode::FALLBACK);
    EXPECT_FALSE(caps->addressable);
    EXPECT_FALSE(caps->can_verify);
    EXPECT_FALSE(accessor.is_addressable());
}

// Test: a missing utility makes the path unusable
TEST_F(UtilityFallbackAccessorTest, DetectCapability_UtilityMissing_AccessDenied) {
    ON_CALL(*runner, is_available("blkdiscard")).WillByDefault(Return(false));
    auto accessor = MakeAccessor();

    auto caps = accessor.detect_capability();

    ASSERT_FALSE(caps.has_value());
    EXPECT_EQ(caps.error().kind, util::ErrorKind::ACCESS_DENIED);
}

// Test: offset-level I/O is unsupported
TEST_F(UtilityFallbackAccessorTest, ChunkIo_Unsupported) {
    auto accessor = MakeAccessor();
    ASSERT_TRUE(accessor.open().has_value());
    std::vector<uint8_t> buffer(512);

    auto written = accessor.write_chunk(0, buffer);
    auto read = accessor.read_chunk(0, buffer);

    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().kind, util::ErrorKind::UNSUPPORTED);
    ASSERT_FALSE(read.has_value());
    EXPECT_EQ(read.error().kind, util::ErrorKind::UNSUPPORTED);
}

// Test: zero fill runs the substituted command once
TEST_F(UtilityFallbackAccessorTest, ZeroFillDevice_RunsCommand) {
    EXPECT_CALL(*runner, run(ElementsAre("blkdiscard", "--zeroout", "/dev/sdb"), _))
        .WillOnce(Return(std::expected<int, util::Error>{0}));
    auto accessor = MakeAccessor();
    ASSERT_TRUE(accessor.open().has_value());

    EXPECT_TRUE(accessor.zero_fill_device(cancel_flag).has_value());
}

// Test: a non-zero exit status is a permanent I/O error
TEST_F(UtilityFallbackAccessorTest, ZeroFillDevice_NonZeroExit_DeviceIo) {
    ON_CALL(*runner, run(_, _)).WillByDefault(Return(std::expected<int, util::Error>{2}));
    auto accessor = MakeAccessor();
    ASSERT_TRUE(accessor.open().has_value());

    auto filled = accessor.zero_fill_device(cancel_flag);

    ASSERT_FALSE(filled.has_value());
    EXPECT_EQ(filled.error().kind, util::ErrorKind::DEVICE_IO);
    EXPECT_EQ(filled.error().code, 2);
    EXPECT_FALSE(filled.error().transient);
}

// Test: a pending cancel prevents the utility from starting
TEST_F(UtilityFallbackAccessorTest, ZeroFillDevice_Cancelled_NotRun) {
    EXPECT_CALL(*runner, run(_, _)).Times(0);
    auto accessor = MakeAccessor();
    ASSERT_TRUE(accessor.open().has_value());
    cancel_flag.store(true);

    auto filled = accessor.zero_fill_device(cancel_flag);

    ASSERT_FALSE(filled.has_value());
    EXPECT_EQ(filled.error().kind, util::ErrorKind::CANCELLATION_REQUESTED);
}

// ============================================================================
// ProcessUtilityRunner (spawns real programs)
// ============================================================================

TEST(ProcessUtilityRunnerTest, Run_ReportsExitStatus) {
    devices::ProcessUtilityRunner runner;
    std::atomic<bool> cancel{false};

    auto ok = runner.run({"true"}, cancel);
    auto failed = runner.run({"false"}, cancel);

    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, 0);
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(*failed, 1);
}

TEST(ProcessUtilityRunnerTest, Run_UnknownProgram_DeviceIo) {
    devices::ProcessUtilityRunner runner;
    std::atomic<bool> cancel{false};

    auto result = runner.run({"disk-sanitizer-no-such-program"}, cancel);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::DEVICE_IO);
    EXPECT_FALSE(runner.is_available("disk-sanitizer-no-such-program"));
    EXPECT_TRUE(runner.is_available("sh"));
}

// Test: cancellation terminates a running child
TEST(ProcessUtilityRunnerTest, Run_Cancelled_TerminatesChild) {
    devices::ProcessUtilityRunner runner;
    std::atomic<bool> cancel{false};

    std::thread canceller([&cancel] {
        std::this_thread::sleep_for(std::chrono::milliseconds{100});
        cancel.store(true);
    });

    std::expected<int, util::Error> result{0};
    bool finished = ThreadingTestHelper::WaitFor(
        [&] { result = runner.run({"sleep", "10"}, cancel); }, std::chrono::milliseconds{5000});
    canceller.join();

    ASSERT_TRUE(finished);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::CANCELLATION_REQUESTED);
}
