// =============================================================================
// Unit tests for ADB input validation (src/adb_security.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "adb_security.hpp"

using namespace batdroid::security;

// ===========================================================================
// isValidAdbId
// ===========================================================================

TEST(AdbSecurityTest, ValidUsbSerial) {
    EXPECT_TRUE(isValidAdbId("ABCDEF123456"));
    EXPECT_TRUE(isValidAdbId("R5CT123ABCD"));
    EXPECT_TRUE(isValidAdbId("emulator-5554"));
}

TEST(AdbSecurityTest, ValidWifiAndMdnsId) {
    EXPECT_TRUE(isValidAdbId("192.168.0.5:5555"));
    EXPECT_TRUE(isValidAdbId("adb-A9250700956-ieJaCE._adb-tls-connect._tcp"));
}

TEST(AdbSecurityTest, InvalidAdbIdEmptyOrTooLong) {
    EXPECT_FALSE(isValidAdbId(""));
    EXPECT_FALSE(isValidAdbId(std::string(65, 'A')));
}

TEST(AdbSecurityTest, InvalidAdbIdShellInjection) {
    EXPECT_FALSE(isValidAdbId("device; rm -rf /"));
    EXPECT_FALSE(isValidAdbId("$(whoami)"));
    EXPECT_FALSE(isValidAdbId("dev`id`"));
    EXPECT_FALSE(isValidAdbId("dev|cat"));
    EXPECT_FALSE(isValidAdbId("dev ice"));
    EXPECT_FALSE(isValidAdbId("dev\nice"));
}

// ===========================================================================
// isSafeShellArg
// ===========================================================================

TEST(AdbSecurityTest, SafeShellArgs) {
    EXPECT_TRUE(isSafeShellArg("input"));
    EXPECT_TRUE(isSafeShellArg("tap"));
    EXPECT_TRUE(isSafeShellArg("540"));
    EXPECT_TRUE(isSafeShellArg("-5"));
    EXPECT_TRUE(isSafeShellArg("/dev/tty"));
}

TEST(AdbSecurityTest, UnsafeShellArgs) {
    EXPECT_FALSE(isSafeShellArg(""));
    EXPECT_FALSE(isSafeShellArg("1;reboot"));
    EXPECT_FALSE(isSafeShellArg("a b"));
    EXPECT_FALSE(isSafeShellArg("$HOME"));
    EXPECT_FALSE(isSafeShellArg("x>y"));
}
