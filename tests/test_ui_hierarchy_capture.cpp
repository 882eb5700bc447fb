// =============================================================================
// Unit tests for UiHierarchyCapture (src/hierarchy/ui_hierarchy_capture.cpp)
// adb is replaced by a scripted executor; no device is needed
// =============================================================================
#include <gtest/gtest.h>
#include "hierarchy/ui_hierarchy_capture.hpp"

#include <deque>
#include <vector>

using namespace batdroid;
using namespace batdroid::adb;
using namespace batdroid::hierarchy;

namespace {

const char* kTwoButtons = R"(<?xml version='1.0' encoding='UTF-8' standalone='yes' ?><hierarchy rotation="0">
<node class="android.widget.FrameLayout" package="com.app" bounds="[0,0][1080,1920]">
<node class="android.widget.Button" text="OK" resource-id="com.app:id/ok" clickable="true" enabled="true" bounds="[100,200][301,251]"/>
<node class="android.widget.Button" text="OK" resource-id="com.app:id/ok2" clickable="true" enabled="true" bounds="[100,400][300,450]"/>
<node class="android.widget.Button" text="Cancel" content-desc="cancel" clickable="true" bounds="[400,400][600,450]"/>
</node>
</hierarchy>
UI hierchary dumped to: /dev/tty
)";

} // namespace

class UiHierarchyCaptureTest : public ::testing::Test {
protected:
    AdbClient adb_{"adb", 15000};
    UiHierarchyCapture capture_{adb_};

    std::vector<CommandRequest> calls_;
    std::deque<Result<CommandOutput>> replies_;

    void SetUp() override {
        adb_.set_executor([this](const CommandRequest& req) -> Result<CommandOutput> {
            calls_.push_back(req);
            if (replies_.empty()) return CommandOutput{};
            Result<CommandOutput> r = replies_.front();
            replies_.pop_front();
            return r;
        });
    }

    void reply(const std::string& stdout_data) {
        CommandOutput out;
        out.stdout_data = stdout_data;
        replies_.push_back(out);
    }

    void reply_error(const std::string& message, int code) {
        replies_.push_back(Err<CommandOutput>(message, code));
    }
};

// ---------------------------------------------------------------------------
// Trailer and envelope
// ---------------------------------------------------------------------------
TEST(DumpOutputTest, StripsTrailerSpellings) {
    const std::string xml = "<hierarchy rotation=\"0\"></hierarchy>";
    EXPECT_EQ(strip_dump_trailer(xml + "\nUI hierchary dumped to: /dev/tty\n"), xml);
    EXPECT_EQ(strip_dump_trailer(xml + "\nUI hierarchy dumped to: /dev/tty"), xml);
    EXPECT_EQ(strip_dump_trailer(xml + "UI HIERARCHY DUMPED TO: /dev/tty  \r\n"), xml);
    EXPECT_EQ(strip_dump_trailer("  \n" + xml + "\n\n"), xml);
}

TEST(DumpOutputTest, TrailerOnlyIsUnexpected) {
    auto r = parse_dump_output("UI hierchary dumped to: /dev/tty\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, errc::kUnexpectedOutput);
    EXPECT_EQ(r.error().message, "UIAutomator dump returned unexpected output: ");
}

TEST(DumpOutputTest, ErrorExcerptIsFirst200Chars) {
    std::string noise = "ERROR: could not get idle state." + std::string(500, 'x');
    auto r = parse_dump_output(noise);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, errc::kUnexpectedOutput);
    EXPECT_EQ(r.error().message,
              "UIAutomator dump returned unexpected output: " + noise.substr(0, 200));
}

TEST(DumpOutputTest, EmptyHierarchyIsEmptyForest) {
    auto r = parse_dump_output("<hierarchy rotation=\"0\"></hierarchy>");
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value().empty());
}

// ---------------------------------------------------------------------------
// capture()
// ---------------------------------------------------------------------------
TEST_F(UiHierarchyCaptureTest, CaptureRunsDumpWithDefaultTimeout) {
    reply(kTwoButtons);
    auto r = capture_.capture();
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_EQ(r.value()[0].children.size(), 3u);

    ASSERT_EQ(calls_.size(), 1u);
    EXPECT_EQ(calls_[0].program, "adb");
    EXPECT_EQ(calls_[0].args,
              (std::vector<std::string>{"exec-out", "uiautomator", "dump", "/dev/tty"}));
    EXPECT_EQ(calls_[0].timeout_ms, kDefaultDumpTimeoutMs);
}

TEST_F(UiHierarchyCaptureTest, CaptureWithDeviceAndTimeout) {
    reply(kTwoButtons);
    CaptureOptions opts;
    opts.device_id = "emulator-5554";
    opts.timeout_ms = 2500;
    ASSERT_TRUE(capture_.capture(opts).is_ok());

    ASSERT_EQ(calls_.size(), 1u);
    EXPECT_EQ(calls_[0].args,
              (std::vector<std::string>{"-s", "emulator-5554", "exec-out", "uiautomator",
                                        "dump", "/dev/tty"}));
    EXPECT_EQ(calls_[0].timeout_ms, 2500);
}

TEST_F(UiHierarchyCaptureTest, CommandTimeoutPropagatesUnchanged) {
    reply_error("adb exec-out uiautomator dump /dev/tty timed out after 10000ms",
                errc::kCommandTimeout);
    auto r = capture_.capture();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, errc::kCommandTimeout);
    EXPECT_EQ(r.error().message, "adb exec-out uiautomator dump /dev/tty timed out after 10000ms");
}

TEST_F(UiHierarchyCaptureTest, CommandFailurePropagatesUnchanged) {
    reply_error("error: no devices/emulators found", errc::kCommandFailed);
    auto r = capture_.capture();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, errc::kCommandFailed);
    EXPECT_EQ(r.error().message, "error: no devices/emulators found");
}

TEST_F(UiHierarchyCaptureTest, EveryCaptureDumpsAgain) {
    reply(kTwoButtons);
    reply("<hierarchy rotation=\"0\"></hierarchy>");
    ASSERT_TRUE(capture_.capture().is_ok());
    auto second = capture_.capture();
    ASSERT_TRUE(second.is_ok());
    EXPECT_TRUE(second.value().empty());
    EXPECT_EQ(calls_.size(), 2u);
}

// ---------------------------------------------------------------------------
// tap_element()
// ---------------------------------------------------------------------------
TEST_F(UiHierarchyCaptureTest, TapRequiresSelectorField) {
    auto r = capture_.tap_element(Selector{});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, errc::kInvalidArgument);
    EXPECT_EQ(r.error().message,
              "at least one of resource_id, text, or content_desc must be provided");
    EXPECT_TRUE(calls_.empty());
}

TEST_F(UiHierarchyCaptureTest, TapUniqueMatchTapsCenter) {
    reply(kTwoButtons);
    Selector s;
    s.content_desc = "cancel";
    auto r = capture_.tap_element(s);
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(r.value().element.text, "Cancel");
    EXPECT_TRUE(r.value().element.children.empty());
    EXPECT_EQ(r.value().center, (Point{500, 425}));

    ASSERT_EQ(calls_.size(), 2u);
    EXPECT_EQ(calls_[1].args,
              (std::vector<std::string>{"shell", "input", "tap", "500", "425"}));
}

TEST_F(UiHierarchyCaptureTest, TapCenterRoundsHalfUp) {
    reply(kTwoButtons);
    Selector s;
    s.resource_id = "ok";
    CaptureOptions opts;
    opts.device_id = "R5CT123ABCD";
    auto r = capture_.tap_element(s, std::nullopt, opts);
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    // bounds [100,200][301,251]: 100 + 201/2 = 200.5, 200 + 51/2 = 225.5
    EXPECT_EQ(r.value().center, (Point{201, 226}));

    ASSERT_EQ(calls_.size(), 2u);
    EXPECT_EQ(calls_[1].args,
              (std::vector<std::string>{"-s", "R5CT123ABCD", "shell", "input", "tap", "201", "226"}));
}

TEST_F(UiHierarchyCaptureTest, TapAmbiguousWithoutIndexDoesNotTap) {
    reply(kTwoButtons);
    Selector s;
    s.text = "OK";
    auto r = capture_.tap_element(s);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, errc::kAmbiguous);
    EXPECT_EQ(r.error().message.rfind("Multiple elements match (2). Specify index:\n", 0), 0u);
    EXPECT_EQ(calls_.size(), 1u);
}

TEST_F(UiHierarchyCaptureTest, TapIndexSelectsMatch) {
    reply(kTwoButtons);
    Selector s;
    s.text = "OK";
    auto r = capture_.tap_element(s, size_t{1});
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(r.value().element.resource_id, "com.app:id/ok2");
    EXPECT_EQ(r.value().center, (Point{200, 425}));
}

TEST_F(UiHierarchyCaptureTest, TapIndexOutOfRange) {
    reply(kTwoButtons);
    Selector s;
    s.text = "OK";
    auto r = capture_.tap_element(s, size_t{5});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, errc::kInvalidArgument);
    EXPECT_EQ(r.error().message, "Index 5 out of range (2 matches)");
    EXPECT_EQ(calls_.size(), 1u);
}

TEST_F(UiHierarchyCaptureTest, TapNotFoundNamesSelector) {
    reply(kTwoButtons);
    Selector s;
    s.text = "Submit";
    auto r = capture_.tap_element(s);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, errc::kNotFound);
    EXPECT_EQ(r.error().message, R"(No element found matching {"text":"Submit"})");
}

TEST_F(UiHierarchyCaptureTest, TapPropagatesDumpFailure) {
    reply_error("adb exec-out uiautomator dump /dev/tty timed out after 10000ms",
                errc::kCommandTimeout);
    Selector s;
    s.text = "OK";
    auto r = capture_.tap_element(s);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, errc::kCommandTimeout);
    EXPECT_EQ(calls_.size(), 1u);
}

TEST_F(UiHierarchyCaptureTest, CaptureRejectsNonHierarchyOutput) {
    std::string noise = "ERROR: could not get idle state.\n" + std::string(300, '-');
    reply(noise);
    auto r = capture_.capture();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, errc::kUnexpectedOutput);
    EXPECT_EQ(r.error().message,
              "UIAutomator dump returned unexpected output: " + noise.substr(0, 200));
}

TEST_F(UiHierarchyCaptureTest, TapIgnoresEmptySelectorValues) {
    Selector blank;
    blank.text = "";
    blank.content_desc = "";
    auto r = capture_.tap_element(blank);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, errc::kInvalidArgument);
    EXPECT_TRUE(calls_.empty());

    // "" next to a real field does not restrict the match
    reply(kTwoButtons);
    Selector s;
    s.content_desc = "cancel";
    s.resource_id = "";
    auto tapped = capture_.tap_element(s);
    ASSERT_TRUE(tapped.is_ok()) << tapped.error().message;
    EXPECT_EQ(tapped.value().element.text, "Cancel");
}

TEST_F(UiHierarchyCaptureTest, TapNotFoundWithInvalidUtf8Text) {
    reply(kTwoButtons);
    Selector s;
    s.text = "Caf\xe9";
    Result<TapResult> r = Error("unset", errc::kOk);
    EXPECT_NO_THROW(r = capture_.tap_element(s));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, errc::kNotFound);
    EXPECT_EQ(r.error().message.rfind("No element found matching {\"text\":\"Caf", 0), 0u);
    EXPECT_EQ(calls_.size(), 1u);
}
