#include "fleet_controller.hpp"
#include "fleet_log.hpp"
#include <algorithm>
#include <chrono>

namespace fleet {

FleetController::FleetController(const CommandRunner& runner, IdentityResolver::AddressNameMap mapping,
                                 const config::FleetConfig& cfg)
    : registry_(runner),
      resolver_(runner, std::move(mapping), cfg.identity.scan_command, cfg.identity.scan_timeout_sec),
      connections_(runner, registry_),
      installer_(runner, registry_, cfg.bridge.install_attempt_timeout_sec),
      apps_(runner) {
    FLOG_INFO("fleet", "Controller ready (%zu mapped addresses)", resolver_.mapping().size());
}

FleetController::~FleetController() {
    waitIdle();
}

void FleetController::trackAsync(std::future<void> fut) {
    std::lock_guard<std::mutex> lock(async_mutex_);
    // Clean up completed futures
    async_ops_.erase(
        std::remove_if(async_ops_.begin(), async_ops_.end(),
            [](const std::future<void>& f) {
                return f.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready;
            }),
        async_ops_.end());
    async_ops_.push_back(std::move(fut));
}

void FleetController::waitIdle() {
    // Handlers may submit follow-up work while we wait
    for (;;) {
        std::vector<std::future<void>> pending;
        {
            std::lock_guard<std::mutex> lock(async_mutex_);
            pending.swap(async_ops_);
        }
        if (pending.empty()) return;
        for (auto& f : pending) {
            if (f.valid()) f.wait();
        }
    }
}

// Work is invoked as work(lease) on the worker; it releases the lease before
// publishing so event handlers may submit the next operation.
template<typename Work>
FleetController::SubmitStatus FleetController::submitGuarded(const std::string& operation, Work work) {
    SingleFlightGuard::Lease lease = guard_.tryAcquire(operation);
    if (!lease) {
        OperationRejectedEvent ev;
        ev.operation = operation;
        ev.holder = guard_.currentOperation().value_or("");
        ev.error = Error("busy: '" + ev.holder + "' is in progress", ErrorKind::Busy);
        FLOG_WARN("fleet", "'%s' rejected: %s", operation.c_str(), ev.error.message.c_str());
        bus_.publish(ev);
        return SubmitStatus::Busy;
    }

    trackAsync(std::async(std::launch::async,
        [operation, work = std::move(work), lease = std::move(lease)]() mutable {
            try {
                work(lease);
            } catch (const std::exception& e) {
                FLOG_ERROR("fleet", "'%s' aborted: %s", operation.c_str(), e.what());
            }
            // The callable outlives this call inside the future's state
            lease.release();
        }));
    return SubmitStatus::Accepted;
}

void FleetController::publishCommand(const std::string& operation, const std::string& target,
                                     CommandResult result) {
    if (result.success) {
        FLOG_INFO("fleet", "%s %s: ok", operation.c_str(), target.c_str());
    } else {
        FLOG_WARN("fleet", "%s %s failed (%s): %s", operation.c_str(), target.c_str(),
                  errorKindName(result.kind), result.errorText().c_str());
    }
    CommandFinishedEvent ev;
    ev.operation = operation;
    ev.target = target;
    ev.result = std::move(result);
    bus_.publish(ev);
}

// =============================================================================
// Single-flight operations
// =============================================================================

FleetController::SubmitStatus FleetController::refreshDevices() {
    return submitGuarded("refresh", [this](SingleFlightGuard::Lease& lease) {
        DevicesRefreshedEvent ev;
        for (auto& dev : registry_.listDevices()) {
            DevicesRefreshedEvent::Entry entry;
            entry.name = resolver_.resolveName(dev.id);
            entry.device = std::move(dev);
            ev.devices.push_back(std::move(entry));
        }
        lease.release();
        FLOG_INFO("fleet", "Refresh: %zu usable device(s)", ev.devices.size());
        bus_.publish(ev);
    });
}

FleetController::SubmitStatus FleetController::listUsableDevices() {
    return submitGuarded("usable", [this](SingleFlightGuard::Lease& lease) {
        UsableDevicesEvent ev;
        ev.devices = resolver_.listUsableDevices();
        lease.release();
        FLOG_INFO("fleet", "LAN listing: %zu device(s)", ev.devices.size());
        bus_.publish(ev);
    });
}

FleetController::SubmitStatus FleetController::connect(const std::string& address) {
    return submitGuarded("connect", [this, address](SingleFlightGuard::Lease& lease) {
        CommandResult result = connections_.connect(address);
        lease.release();
        publishCommand("connect", address, std::move(result));
    });
}

FleetController::SubmitStatus FleetController::disconnect(const std::string& device_id) {
    return submitGuarded("disconnect", [this, device_id](SingleFlightGuard::Lease& lease) {
        CommandResult result = connections_.disconnect(device_id);
        lease.release();
        publishCommand("disconnect", device_id, std::move(result));
    });
}

FleetController::SubmitStatus FleetController::uninstall(const std::string& device_id,
                                                         const std::string& package_name) {
    return submitGuarded("uninstall", [this, device_id, package_name](SingleFlightGuard::Lease& lease) {
        CommandResult result = apps_.uninstall(device_id, package_name);
        lease.release();
        publishCommand("uninstall", device_id, std::move(result));
    });
}

FleetController::SubmitStatus FleetController::clearData(const std::string& device_id,
                                                         const std::string& package_name) {
    return submitGuarded("clear", [this, device_id, package_name](SingleFlightGuard::Lease& lease) {
        CommandResult result = apps_.clearData(device_id, package_name);
        lease.release();
        publishCommand("clear", device_id, std::move(result));
    });
}

FleetController::SubmitStatus FleetController::forceStop(const std::string& device_id,
                                                         const std::string& package_name) {
    return submitGuarded("stop", [this, device_id, package_name](SingleFlightGuard::Lease& lease) {
        CommandResult result = apps_.forceStop(device_id, package_name);
        lease.release();
        publishCommand("stop", device_id, std::move(result));
    });
}

// =============================================================================
// Installs
// =============================================================================

uint64_t FleetController::install(const std::string& device_id, const std::string& artifact_path) {
    const uint64_t id = next_install_id_.fetch_add(1);
    active_installs_.fetch_add(1);
    FLOG_INFO("fleet", "Install #%llu queued: %s -> %s",
              (unsigned long long)id, artifact_path.c_str(), device_id.c_str());

    trackAsync(std::async(std::launch::async, [this, id, device_id, artifact_path]() {
        InstallFinishedEvent ev;
        ev.install_id = id;
        ev.device_id = device_id;
        ev.artifact_path = artifact_path;
        try {
            ev.outcome = installer_.install(device_id, artifact_path);
        } catch (const std::exception& e) {
            FLOG_ERROR("fleet", "Install #%llu aborted: %s", (unsigned long long)id, e.what());
            ev.outcome.success = false;
            ev.outcome.error = std::string("install aborted: ") + e.what();
            ev.outcome.kind = ErrorKind::ExecutionFailure;
        }
        ev.still_running = active_installs_.fetch_sub(1) - 1;
        FLOG_INFO("fleet", "Install #%llu %s (%zu still running)", (unsigned long long)id,
                  ev.outcome.success ? "succeeded" : "failed", ev.still_running);
        bus_.publish(ev);
    }));
    return id;
}

} // namespace fleet
