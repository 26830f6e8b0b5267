#include "app_control.hpp"
#include "command_security.hpp"
#include "fleet_log.hpp"

namespace fleet {

CommandResult AppControl::runForPackage(const std::string& device_id, const std::string& package_name,
                                        const std::string& verb) const {
    if (!security::isValidDeviceId(device_id)) {
        FLOG_ERROR("app", "Invalid device ID rejected: %s", device_id.c_str());
        return CommandResult::failure("invalid device id: " + device_id, ErrorKind::ValidationFailure);
    }
    if (!security::isValidPackageName(package_name)) {
        FLOG_ERROR("app", "Invalid package name rejected: %s", package_name.c_str());
        return CommandResult::failure("invalid package name: " + package_name, ErrorKind::ValidationFailure);
    }

    FLOG_INFO("app", "%s %s on %s", verb.c_str(), package_name.c_str(), device_id.c_str());
    CommandResult result = runner_.run("-s " + device_id + " " + verb + " " + package_name,
                                       runner_.controlTimeout());
    // pm/am report some failures on stdout with exit status 0
    if (result.success && result.outputText().rfind("Failure", 0) == 0) {
        return CommandResult::failure(result.outputText(), ErrorKind::ExecutionFailure, result.output);
    }
    return result;
}

CommandResult AppControl::uninstall(const std::string& device_id, const std::string& package_name) const {
    return runForPackage(device_id, package_name, "uninstall");
}

CommandResult AppControl::clearData(const std::string& device_id, const std::string& package_name) const {
    return runForPackage(device_id, package_name, "shell pm clear");
}

CommandResult AppControl::forceStop(const std::string& device_id, const std::string& package_name) const {
    return runForPackage(device_id, package_name, "shell am force-stop");
}

} // namespace fleet
