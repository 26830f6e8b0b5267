#pragma once
// =============================================================================
// command_security.hpp
//
// Validation and quoting helpers for values that end up inside bridge command
// lines. Every device id, address and package name passes through here before
// a command line is assembled.
// =============================================================================

#include <string>
#include <cstring>
#include <cctype>
#include <regex>

namespace fleet {
namespace security {

// Dangerous shell metacharacters that could enable command injection
constexpr const char* SHELL_METACHARACTERS = "|;&$`\\\"'<>(){}[]!#*?~\n\r";

/**
 * Validate a bridge device id or network address.
 * Valid formats:
 *   - Serial number: alphanumeric, may include ':', '.', '-', '_'
 *   - host:port: 192.168.1.50:5555
 *
 * @param device_id  The device id to validate
 * @return true if safe to place in a command line
 */
inline bool isValidDeviceId(const std::string& device_id) {
    if (device_id.empty() || device_id.length() > 64) {
        return false;
    }

    for (char c : device_id) {
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
 * Validate an Android application package name (com.example.app).
 */
inline bool isValidPackageName(const std::string& package_name) {
    if (package_name.empty() || package_name.length() > 255) {
        return false;
    }
    static const std::regex pattern(R"(^[A-Za-z][A-Za-z0-9_]*(\.[A-Za-z0-9_]+)*$)");
    return std::regex_match(package_name, pattern);
}

/**
 * Double-quote a local path for a command line.
 * Embedded quotes and backslash-quote sequences are escaped.
 *
 * @param path  Host file path
 * @return Quoted argument
 */
inline std::string quotePath(const std::string& path) {
    std::string quoted;
    quoted.reserve(path.length() + 2);
    quoted += '"';
    for (char c : path) {
#ifndef _WIN32
        if (c == '"' || c == '$' || c == '`' || c == '\\') {
            quoted += '\\';
        }
#else
        if (c == '"') {
            quoted += '\\';
        }
#endif
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

/**
 * Split "host:port" into host part.
 *
 * @param device_id  e.g. "192.168.0.5:5555"
 * @return "192.168.0.5", or the input unchanged when it carries no port
 */
inline std::string stripPort(const std::string& device_id) {
    size_t colon_pos = device_id.find(':');
    if (colon_pos != std::string::npos) {
        return device_id.substr(0, colon_pos);
    }
    return device_id;
}

} // namespace security
} // namespace fleet
