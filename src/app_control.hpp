#pragma once
#include <string>
#include "command_runner.hpp"

namespace fleet {

/**
 * Per-package operations on one device. Each is a single bridge call; device
 * id and package name are validated before the command line is built.
 */
class AppControl {
public:
    explicit AppControl(const CommandRunner& runner) : runner_(runner) {}

    // adb uninstall <package>
    CommandResult uninstall(const std::string& device_id, const std::string& package_name) const;

    // adb shell pm clear <package>
    CommandResult clearData(const std::string& device_id, const std::string& package_name) const;

    // adb shell am force-stop <package>
    CommandResult forceStop(const std::string& device_id, const std::string& package_name) const;

private:
    CommandResult runForPackage(const std::string& device_id, const std::string& package_name,
                                const std::string& verb) const;

    const CommandRunner& runner_;
};

} // namespace fleet
