#pragma once
// =============================================================================
// adb_security.hpp
//
// Validation applied before a caller-supplied value reaches an adb argv.
// adb forwards "shell" arguments to the device shell, so anything that ends
// up there must be free of shell metacharacters.
// =============================================================================

#include <string>
#include <cstring>
#include <cctype>

namespace batdroid {
namespace security {

// Dangerous shell metacharacters that could enable command injection
constexpr const char* SHELL_METACHARACTERS = "|;&$`\\\"'<>(){}[]!#*?~\n\r";

/**
 * Validate ADB device ID format.
 * Valid formats:
 *   - Serial number: alphanumeric, may include ':', '.', '-', '_'
 *   - IP:port: xxx.xxx.xxx.xxx:port
 *   - mDNS: adb-SERIAL-hash._adb-tls-connect._tcp
 *
 * @param adb_id  The device ID to validate
 * @return true if valid, false if potentially malicious
 */
inline bool isValidAdbId(const std::string& adb_id) {
    if (adb_id.empty() || adb_id.length() > 64) {
        return false;
    }

    for (char c : adb_id) {
        if (std::strchr(SHELL_METACHARACTERS, c) != nullptr) {
            return false;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != ':' && c != '.' && c != '-' && c != '_') {
            return false;
        }
    }

    return true;
}

/**
 * True when the argument can be passed to "adb shell" verbatim.
 * Rejects empty strings, whitespace and shell metacharacters.
 */
inline bool isSafeShellArg(const std::string& arg) {
    if (arg.empty()) return false;
    for (char c : arg) {
        if (std::strchr(SHELL_METACHARACTERS, c) != nullptr) return false;
        if (std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace security
} // namespace batdroid
