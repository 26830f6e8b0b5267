#include "device_registry.hpp"
#include "command_security.hpp"
#include "fleet_log.hpp"
#include <sstream>

namespace fleet {

// =============================================================================
// Parsing
// =============================================================================

DeviceRegistry::Status DeviceRegistry::parseStatus(const std::string& token) {
    if (token == "device") return Status::Device;
    if (token == "unauthorized") return Status::Unauthorized;
    if (token == "offline") return Status::Offline;
    if (token.rfind("no permissions", 0) == 0) return Status::NoPermissions;
    if (token == "recovery") return Status::Recovery;
    if (token == "sideload") return Status::Sideload;
    if (token == "bootloader") return Status::Bootloader;
    return Status::Unknown;
}

const char* DeviceRegistry::statusName(Status status) {
    switch (status) {
        case Status::Device:        return "device";
        case Status::Unauthorized:  return "unauthorized";
        case Status::Offline:       return "offline";
        case Status::NoPermissions: return "no permissions";
        case Status::Recovery:      return "recovery";
        case Status::Sideload:      return "sideload";
        case Status::Bootloader:    return "bootloader";
        case Status::Unknown:       return "unknown";
    }
    return "unknown";
}

std::vector<DeviceRegistry::Device> DeviceRegistry::parseDeviceList(const std::string& output) {
    std::vector<Device> devices;
    std::istringstream iss(output);
    std::string line;

    // First line is the "List of devices attached" header
    if (!std::getline(iss, line)) return devices;

    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trimCopy(line).empty()) continue;
        if (line[0] == '*') continue;  // daemon status comments

        // "<id>\t<status>[\t...]"
        size_t tab_pos = line.find('\t');
        if (tab_pos == std::string::npos) continue;

        size_t status_end = line.find('\t', tab_pos + 1);
        std::string id = trimCopy(line.substr(0, tab_pos));
        std::string status = trimCopy(line.substr(tab_pos + 1,
            status_end == std::string::npos ? std::string::npos : status_end - tab_pos - 1));
        if (id.empty()) continue;

        Device dev;
        dev.id = id;
        dev.status_text = status;
        dev.status = parseStatus(status);
        devices.push_back(dev);
    }

    return devices;
}

std::vector<DeviceRegistry::Device> DeviceRegistry::parseUsableDevices(const std::string& output) {
    std::vector<Device> usable;
    for (auto& dev : parseDeviceList(output)) {
        if (dev.usable()) {
            usable.push_back(std::move(dev));
        }
    }
    return usable;
}

// =============================================================================
// Bridge queries
// =============================================================================

std::vector<DeviceRegistry::Device> DeviceRegistry::listDevices() const {
    CommandResult result = runner_.run("devices", runner_.controlTimeout());
    if (!result.success) {
        FLOG_WARN("registry", "Device enumeration failed (%s): %s",
                  errorKindName(result.kind), result.errorText().c_str());
        return {};
    }

    auto all = parseDeviceList(result.outputText());
    std::vector<Device> usable;
    for (const auto& dev : all) {
        if (dev.usable()) {
            usable.push_back(dev);
        } else {
            FLOG_INFO("registry", "Skipping %s (%s)", dev.id.c_str(), dev.status_text.c_str());
        }
    }

    FLOG_INFO("registry", "Found %zu devices (%zu usable)", all.size(), usable.size());
    return usable;
}

bool DeviceRegistry::isUsable(const std::string& device_id) const {
    for (const auto& dev : listDevices()) {
        if (dev.id == device_id) return true;
    }
    return false;
}

std::optional<std::string> DeviceRegistry::getProp(const std::string& device_id, const std::string& prop) const {
    if (!security::isValidDeviceId(device_id)) {
        FLOG_ERROR("registry", "Invalid device ID rejected: %s", device_id.c_str());
        return std::nullopt;
    }

    CommandResult result = runner_.run("-s " + device_id + " shell getprop " + prop, runner_.controlTimeout());
    if (!result.success) {
        FLOG_DEBUG("registry", "getprop %s failed on %s", prop.c_str(), device_id.c_str());
        return std::nullopt;
    }
    return result.outputText();
}

DeviceRegistry::DeviceInfo DeviceRegistry::getDeviceInfo(const std::string& device_id) const {
    DeviceInfo info;
    info.model = getProp(device_id, "ro.product.model");
    info.android_version = getProp(device_id, "ro.build.version.release");
    info.brand = getProp(device_id, "ro.product.brand");
    return info;
}

} // namespace fleet
