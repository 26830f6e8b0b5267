#pragma once
#include <string>
#include "command_runner.hpp"
#include "device_registry.hpp"
#include "result.hpp"

namespace fleet {

constexpr int kDefaultConnectPort = 5555;

constexpr const char* kConnectFailedMessage =
    "connection failed: make sure network debugging is enabled on the device";

/**
 * Connection Controller
 * Network connect/disconnect for bridge devices.
 *
 * `adb connect` exits 0 for most outcomes, so success is decided from its
 * output text; when the text is inconclusive the device list is re-queried.
 */
class ConnectionController {
public:
    ConnectionController(const CommandRunner& runner, const DeviceRegistry& registry)
        : runner_(runner), registry_(registry) {}

    // address: host:port (callers append the default port, see normalizeConnectAddress)
    CommandResult connect(const std::string& address) const;

    // Single pass-through `disconnect <id>`
    CommandResult disconnect(const std::string& device_id) const;

    // True if an enumerated id denotes `address` (host:port exact, or same host when
    // `address` has no port)
    static bool idMatchesAddress(const std::string& device_id, const std::string& address);

private:
    const CommandRunner& runner_;
    const DeviceRegistry& registry_;
};

/**
 * Caller-side address normalization.
 *   "192.168.1.50"      -> "192.168.1.50:5555"
 *   "192.168.1.50:5556" -> unchanged
 *   "1.50" (two octets) -> "<lan_prefix>1.50:5555" when lan_prefix is set
 */
Result<std::string> normalizeConnectAddress(const std::string& input,
                                            int default_port = kDefaultConnectPort,
                                            const std::string& lan_prefix = "");

} // namespace fleet
