#pragma once
#include <string>
#include <vector>
#include <optional>
#include "command_runner.hpp"

namespace fleet {

/**
 * Device Registry
 * Enumerates devices attached to the bridge (`adb devices`) and queries
 * per-device properties. Every call re-derives state; nothing is cached.
 */
class DeviceRegistry {
public:
    enum class Status {
        Device,         // online and authorized
        Unauthorized,   // RSA key not yet accepted on the device
        Offline,
        NoPermissions,  // host lacks USB permissions
        Recovery,
        Sideload,
        Bootloader,
        Unknown
    };

    struct Device {
        std::string id;               // serial or address:port
        Status status = Status::Unknown;
        std::string status_text;      // raw token as printed by the bridge

        bool usable() const { return status == Status::Device; }
    };

    struct DeviceInfo {
        std::optional<std::string> model;            // ro.product.model
        std::optional<std::string> android_version;  // ro.build.version.release
        std::optional<std::string> brand;            // ro.product.brand
    };

    explicit DeviceRegistry(const CommandRunner& runner) : runner_(runner) {}

    // Usable devices only (status == "device"); empty on any bridge failure
    std::vector<Device> listDevices() const;

    // True if `device_id` is in a fresh listDevices() snapshot
    bool isUsable(const std::string& device_id) const;

    // Three independent property queries; each field set only if its query succeeded
    DeviceInfo getDeviceInfo(const std::string& device_id) const;

    // Single `getprop` query
    std::optional<std::string> getProp(const std::string& device_id, const std::string& prop) const;

    // Parse every entry of `devices` output, whatever its status
    static std::vector<Device> parseDeviceList(const std::string& output);

    // Parse and keep only usable entries
    static std::vector<Device> parseUsableDevices(const std::string& output);

    static Status parseStatus(const std::string& token);
    static const char* statusName(Status status);

private:
    const CommandRunner& runner_;
};

} // namespace fleet
