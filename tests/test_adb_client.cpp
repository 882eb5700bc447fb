// =============================================================================
// Unit tests for AdbClient (src/adb/adb_client.cpp)
// Fake executor records requests; no adb binary is run
// =============================================================================
#include <gtest/gtest.h>
#include "adb/adb_client.hpp"

#include <vector>

using namespace batdroid;
using namespace batdroid::adb;

class AdbClientTest : public ::testing::Test {
protected:
    AdbClient client_{"adb", 15000};
    std::vector<CommandRequest> calls_;
    std::string reply_ = "ok";

    void SetUp() override {
        client_.set_executor([this](const CommandRequest& req) -> Result<CommandOutput> {
            calls_.push_back(req);
            CommandOutput out;
            out.stdout_data = reply_;
            return out;
        });
    }
};

TEST_F(AdbClientTest, RunWithoutDeviceUsesDefaultTimeout) {
    auto result = client_.run({"devices", "-l"});
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), "ok");

    ASSERT_EQ(calls_.size(), 1u);
    EXPECT_EQ(calls_[0].program, "adb");
    EXPECT_EQ(calls_[0].args, (std::vector<std::string>{"devices", "-l"}));
    EXPECT_EQ(calls_[0].timeout_ms, 15000);
}

TEST_F(AdbClientTest, DeviceIdPrefixesSerialFlag) {
    AdbOptions opts;
    opts.device_id = "emulator-5554";
    opts.timeout_ms = 3000;
    ASSERT_TRUE(client_.run({"shell", "getprop"}, opts).is_ok());

    ASSERT_EQ(calls_.size(), 1u);
    EXPECT_EQ(calls_[0].args,
              (std::vector<std::string>{"-s", "emulator-5554", "shell", "getprop"}));
    EXPECT_EQ(calls_[0].timeout_ms, 3000);
}

TEST_F(AdbClientTest, InvalidDeviceIdRejectedBeforeExec) {
    AdbOptions opts;
    opts.device_id = "x; reboot";
    auto result = client_.run({"shell", "ls"}, opts);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code, errc::kInvalidArgument);
    EXPECT_TRUE(calls_.empty());
}

TEST_F(AdbClientTest, ExecutorErrorPropagatesUnchanged) {
    client_.set_executor([](const CommandRequest&) -> Result<CommandOutput> {
        return Err<CommandOutput>("adb exec-out uiautomator dump /dev/tty timed out after 10000ms",
                                  errc::kCommandTimeout);
    });
    auto result = client_.run({"exec-out", "uiautomator", "dump", "/dev/tty"});
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code, errc::kCommandTimeout);
    EXPECT_EQ(result.error().message, "adb exec-out uiautomator dump /dev/tty timed out after 10000ms");
}

TEST_F(AdbClientTest, TapBuildsInputCommand) {
    AdbOptions opts;
    opts.device_id = "R5CT123ABCD";
    ASSERT_TRUE(client_.tap(540, 960, opts).is_ok());

    ASSERT_EQ(calls_.size(), 1u);
    EXPECT_EQ(calls_[0].args,
              (std::vector<std::string>{"-s", "R5CT123ABCD", "shell", "input", "tap", "540", "960"}));
}

TEST_F(AdbClientTest, ShellRejectsUnsafeArgument) {
    auto result = client_.shell({"input", "text", "a;reboot"});
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code, errc::kInvalidArgument);
    EXPECT_TRUE(calls_.empty());
}

TEST(AdbClientDefaultsTest, NonPositiveDefaultTimeoutReplaced) {
    AdbClient client("adb", 0);
    EXPECT_EQ(client.default_timeout_ms(), AdbClient::kDefaultTimeoutMs);
}
