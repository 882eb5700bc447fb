#pragma once
// =============================================================================
// UiHierarchyCapture - dump the live accessibility tree from a device
// =============================================================================
//   adb [-s id] exec-out uiautomator dump /dev/tty
//     -> strip "UI hierchary dumped to: ..." trailer, trim
//     -> require "<hierarchy"
//     -> parse_hierarchy_xml()
// Every call dumps again; nothing is cached between calls.
// =============================================================================

#include <string>
#include <optional>
#include <cstddef>

#include "ui_element.hpp"
#include "../adb/adb_client.hpp"
#include "../result.hpp"

namespace batdroid::hierarchy {

constexpr int kDefaultDumpTimeoutMs = 10000;
constexpr size_t kDiagnosticExcerptChars = 200;

struct CaptureOptions {
    std::string device_id;
    int timeout_ms = kDefaultDumpTimeoutMs;
};

struct TapResult {
    UiElement element;   // tapped element, children dropped
    Point center;
};

/// Remove a trailing "UI hierarchy dumped to: <path>" line (case-insensitive,
/// also the "hierchary" spelling uiautomator really prints), then trim.
std::string strip_dump_trailer(const std::string& raw);

/// strip_dump_trailer + envelope check + parse.
/// Missing "<hierarchy" -> errc::kUnexpectedOutput with the first 200 chars.
Result<Forest> parse_dump_output(const std::string& raw);

class UiHierarchyCapture {
public:
    explicit UiHierarchyCapture(adb::AdbClient& adb);

    UiHierarchyCapture(const UiHierarchyCapture&) = delete;
    UiHierarchyCapture& operator=(const UiHierarchyCapture&) = delete;

    /// Dump and parse. Command failures and timeouts are returned unchanged.
    Result<Forest> capture(const CaptureOptions& opts = {});

    /// Capture, find the element matching the selector, tap its center.
    /// Fields holding "" are ignored; a selector with nothing left is
    /// errc::kInvalidArgument. index picks among several matches; see
    /// select_match().
    Result<TapResult> tap_element(const Selector& selector,
                                  std::optional<size_t> index = std::nullopt,
                                  const CaptureOptions& opts = {});

private:
    adb::AdbClient& adb_;
};

} // namespace batdroid::hierarchy
