// =============================================================================
// AdbFleet - Fleet Controller
// =============================================================================
// Runs bridge operations off the calling thread.
//   - refresh / usable listing / connect / disconnect / per-package operations
//     share one single-flight slot: a request while the slot is taken returns
//     Busy immediately and publishes OperationRejectedEvent
//   - installs each get their own task and never block one another
// Results arrive as events on events(), published from the worker thread.
// =============================================================================
#pragma once
#include <atomic>
#include <cstdint>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "app_control.hpp"
#include "command_runner.hpp"
#include "connection_controller.hpp"
#include "device_registry.hpp"
#include "event_bus.hpp"
#include "fleet_config.hpp"
#include "identity_resolver.hpp"
#include "installation_engine.hpp"
#include "single_flight_guard.hpp"

namespace fleet {

class FleetController {
public:
    enum class SubmitStatus { Accepted, Busy };

    // `mapping` is read-only for the controller's lifetime
    FleetController(const CommandRunner& runner, IdentityResolver::AddressNameMap mapping,
                    const config::FleetConfig& cfg = config::FleetConfig{});
    ~FleetController();

    FleetController(const FleetController&) = delete;
    FleetController& operator=(const FleetController&) = delete;

    EventBus& events() { return bus_; }

    // --- Single-flight operations ---
    SubmitStatus refreshDevices();
    SubmitStatus listUsableDevices();
    SubmitStatus connect(const std::string& address);
    SubmitStatus disconnect(const std::string& device_id);
    SubmitStatus uninstall(const std::string& device_id, const std::string& package_name);
    SubmitStatus clearData(const std::string& device_id, const std::string& package_name);
    SubmitStatus forceStop(const std::string& device_id, const std::string& package_name);

    // --- Unrestricted ---
    // Always accepted; the returned id tags the matching InstallFinishedEvent
    uint64_t install(const std::string& device_id, const std::string& artifact_path);

    size_t activeInstalls() const { return active_installs_.load(); }
    std::optional<std::string> currentOperation() const { return guard_.currentOperation(); }

    // Blocks until every submitted task has finished
    void waitIdle();

    // Synchronous access for callers that do their own threading
    const DeviceRegistry& registry() const { return registry_; }
    const IdentityResolver& resolver() const { return resolver_; }
    const ConnectionController& connections() const { return connections_; }
    const InstallationEngine& installer() const { return installer_; }
    const AppControl& apps() const { return apps_; }

private:
    template<typename Work>
    SubmitStatus submitGuarded(const std::string& operation, Work work);

    void trackAsync(std::future<void> fut);
    void publishCommand(const std::string& operation, const std::string& target, CommandResult result);

    DeviceRegistry registry_;
    IdentityResolver resolver_;
    ConnectionController connections_;
    InstallationEngine installer_;
    AppControl apps_;

    EventBus bus_;
    SingleFlightGuard guard_;

    std::atomic<uint64_t> next_install_id_{1};
    std::atomic<size_t> active_installs_{0};

    // Track async operations to avoid detached threads on shutdown
    std::mutex async_mutex_;
    std::vector<std::future<void>> async_ops_;
};

} // namespace fleet
