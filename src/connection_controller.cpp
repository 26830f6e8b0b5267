#include "connection_controller.hpp"
#include "command_security.hpp"
#include "fleet_log.hpp"
#include <algorithm>
#include <cctype>

namespace fleet {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // anonymous namespace

bool ConnectionController::idMatchesAddress(const std::string& device_id, const std::string& address) {
    if (device_id == address) return true;
    if (address.find(':') == std::string::npos) {
        return security::stripPort(device_id) == address;
    }
    return false;
}

CommandResult ConnectionController::connect(const std::string& address) const {
    if (!security::isValidDeviceId(address)) {
        FLOG_ERROR("connect", "Invalid address rejected: %s", address.c_str());
        return CommandResult::failure("invalid device address: " + address, ErrorKind::ValidationFailure);
    }

    FLOG_INFO("connect", "Connecting to %s", address.c_str());
    CommandResult result = runner_.run("connect " + address, runner_.controlTimeout());
    if (!result.success) {
        return result;
    }

    const std::string text = toLower(result.outputText());

    if (text.find("connected to") != std::string::npos ||
        text.find("already connected to") != std::string::npos) {
        FLOG_INFO("connect", "Connected: %s", result.outputText().c_str());
        return result;
    }

    if (text.find("cannot connect to") != std::string::npos ||
        text.find("failed to connect") != std::string::npos) {
        FLOG_WARN("connect", "Bridge refused %s: %s", address.c_str(), result.outputText().c_str());
        return CommandResult::failure(kConnectFailedMessage, ErrorKind::ExecutionFailure, result.output);
    }

    // Inconclusive output: ask the bridge what it actually has
    FLOG_WARN("connect", "Ambiguous connect output for %s: '%s'; re-checking device list",
              address.c_str(), result.outputText().c_str());
    for (const auto& dev : registry_.listDevices()) {
        if (idMatchesAddress(dev.id, address)) {
            FLOG_INFO("connect", "Verified %s via device list (%s)", address.c_str(), dev.id.c_str());
            return result;
        }
    }

    FLOG_WARN("connect", "%s not present after connect", address.c_str());
    return CommandResult::failure(kConnectFailedMessage, ErrorKind::AmbiguousOutcome, result.output);
}

CommandResult ConnectionController::disconnect(const std::string& device_id) const {
    if (!security::isValidDeviceId(device_id)) {
        FLOG_ERROR("connect", "Invalid device ID rejected: %s", device_id.c_str());
        return CommandResult::failure("invalid device id: " + device_id, ErrorKind::ValidationFailure);
    }

    FLOG_INFO("connect", "Disconnecting %s", device_id.c_str());
    return runner_.run("disconnect " + device_id, runner_.controlTimeout());
}

Result<std::string> normalizeConnectAddress(const std::string& input, int default_port,
                                            const std::string& lan_prefix) {
    std::string address = trimCopy(input);
    if (address.empty()) {
        return Err<std::string>("empty address", ErrorKind::ValidationFailure);
    }

    size_t colon = address.find(':');
    if (colon != std::string::npos) {
        if (!isDigits(address.substr(colon + 1))) {
            return Err<std::string>("invalid port in address: " + address, ErrorKind::ValidationFailure);
        }
    } else {
        // "1.50" shorthand for a host on the configured /16
        if (!lan_prefix.empty() && std::count(address.begin(), address.end(), '.') == 1 &&
            address.rfind(lan_prefix, 0) != 0) {
            address = lan_prefix + address;
        }
        address += ":" + std::to_string(default_port);
    }

    if (!security::isValidDeviceId(address)) {
        return Err<std::string>("invalid address: " + address, ErrorKind::ValidationFailure);
    }
    return Ok(address);
}

} // namespace fleet
