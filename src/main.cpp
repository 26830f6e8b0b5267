// =============================================================================
// AdbFleet - command line front end
// =============================================================================
// adbfleet [--config FILE] [-v] <command> [args...]
// Results go to stdout, log lines to stderr and the configured log file.
// =============================================================================
#include <atomic>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>
#include "command_runner.hpp"
#include "connection_controller.hpp"
#include "fleet_config.hpp"
#include "fleet_controller.hpp"
#include "fleet_log.hpp"
#include "identity_resolver.hpp"

using namespace fleet;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

void printUsage() {
    fprintf(stderr,
        "usage: adbfleet [--config FILE] [-v] <command> [args]\n"
        "  devices                       list usable devices with names\n"
        "  info <id>                     model / Android version / brand\n"
        "  usable                        mapped LAN devices seen on the network\n"
        "  name <id>                     resolve a device id to its mapped name\n"
        "  connect <host[:port]>         network connect\n"
        "  disconnect <id>               network disconnect\n"
        "  install <id> <apk>...         install packages (in parallel)\n"
        "  uninstall|clear|stop <id> <package>\n"
        "  diagnose <id> <apk>           install preflight report\n");
}

void printCommandResult(const CommandFinishedEvent& e) {
    if (e.result.success) {
        printf("%s %s: OK", e.operation.c_str(), e.target.c_str());
        if (!e.result.outputText().empty()) printf(" (%s)", e.result.outputText().c_str());
        printf("\n");
    } else {
        printf("%s %s: FAILED [%s] %s\n", e.operation.c_str(), e.target.c_str(),
               errorKindName(e.result.kind), e.result.errorText().c_str());
    }
}

// Runs one single-flight submission and waits for its CommandFinishedEvent
template<typename Submit>
int runCommand(FleetController& controller, Submit submit) {
    std::atomic<int> rc{kExitFailed};
    auto sub = controller.events().subscribe<CommandFinishedEvent>([&rc](const CommandFinishedEvent& e) {
        printCommandResult(e);
        rc = e.result.success ? kExitOk : kExitFailed;
    });
    auto rejected = controller.events().subscribe<OperationRejectedEvent>([](const OperationRejectedEvent& e) {
        fprintf(stderr, "%s: %s\n", e.operation.c_str(), e.error.message.c_str());
    });
    if (submit() == FleetController::SubmitStatus::Busy) {
        return kExitFailed;
    }
    controller.waitIdle();
    return rc.load();
}

int cmdDevices(FleetController& controller) {
    auto sub = controller.events().subscribe<DevicesRefreshedEvent>([](const DevicesRefreshedEvent& e) {
        if (e.devices.empty()) {
            printf("no usable devices\n");
            return;
        }
        for (const auto& entry : e.devices) {
            if (entry.name != entry.device.id) {
                printf("%-24s %-8s %s\n", entry.device.id.c_str(),
                       entry.device.status_text.c_str(), entry.name.c_str());
            } else {
                printf("%-24s %s\n", entry.device.id.c_str(), entry.device.status_text.c_str());
            }
        }
    });
    controller.refreshDevices();
    controller.waitIdle();
    return kExitOk;
}

int cmdUsable(FleetController& controller) {
    auto sub = controller.events().subscribe<UsableDevicesEvent>([](const UsableDevicesEvent& e) {
        if (e.devices.empty()) {
            printf("no mapped devices on the network\n");
            return;
        }
        for (const auto& d : e.devices) {
            printf("%-16s %-18s %s\n", d.ip.c_str(), d.mac.c_str(), d.name.c_str());
        }
    });
    controller.listUsableDevices();
    controller.waitIdle();
    return kExitOk;
}

int cmdInfo(FleetController& controller, const std::string& id) {
    DeviceRegistry::DeviceInfo info = controller.registry().getDeviceInfo(id);
    printf("model:   %s\n", info.model ? info.model->c_str() : "(unknown)");
    printf("android: %s\n", info.android_version ? info.android_version->c_str() : "(unknown)");
    printf("brand:   %s\n", info.brand ? info.brand->c_str() : "(unknown)");
    return (info.model || info.android_version || info.brand) ? kExitOk : kExitFailed;
}

int cmdInstall(FleetController& controller, const std::string& id, const std::vector<std::string>& apks) {
    std::atomic<int> failures{0};
    auto sub = controller.events().subscribe<InstallFinishedEvent>([&failures](const InstallFinishedEvent& e) {
        if (e.outcome.success) {
            printf("[#%llu] %s -> %s: OK (%s)\n", (unsigned long long)e.install_id,
                   e.artifact_path.c_str(), e.device_id.c_str(), e.outcome.strategy.c_str());
        } else {
            failures++;
            printf("[#%llu] %s -> %s: FAILED [%s]\n%s\n", (unsigned long long)e.install_id,
                   e.artifact_path.c_str(), e.device_id.c_str(),
                   errorKindName(e.outcome.kind), e.outcome.errorText().c_str());
        }
        fflush(stdout);
    });
    for (const auto& apk : apks) {
        controller.install(id, apk);
    }
    controller.waitIdle();
    return failures.load() == 0 ? kExitOk : kExitFailed;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path = "config.json";
    bool config_given = false;
    bool verbose = false;

    int i = 1;
    for (; i < argc; ++i) {
        if (strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                printUsage();
                return kExitUsage;
            }
            config_path = argv[++i];
            config_given = true;
        } else if (strcmp(argv[i], "-v") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage();
            return kExitOk;
        } else {
            break;
        }
    }
    if (i >= argc) {
        printUsage();
        return kExitUsage;
    }
    const std::string command = argv[i++];
    std::vector<std::string> args(argv + i, argv + argc);

    const config::FleetConfig cfg = config::loadConfig(config_path, config_given);

    fleet::log::setLogLevel(verbose ? fleet::log::Level::Debug : fleet::log::parseLevel(cfg.log.level));
    if (!cfg.log.log_path.empty() && !fleet::log::openLogFile(cfg.log.log_path.c_str())) {
        FLOG_WARN("main", "Cannot open log file %s", cfg.log.log_path.c_str());
    }

    CommandRunner runner(CommandRunner::locateBridge(cfg.bridge.path), launchProcess,
                         cfg.bridge.control_timeout_sec);
    FleetController controller(runner, IdentityResolver::loadMapping(cfg.identity.mapping_path), cfg);

    int rc = kExitUsage;
    if (command == "devices" && args.empty()) {
        rc = cmdDevices(controller);
    } else if (command == "usable" && args.empty()) {
        rc = cmdUsable(controller);
    } else if (command == "info" && args.size() == 1) {
        rc = cmdInfo(controller, args[0]);
    } else if (command == "name" && args.size() == 1) {
        printf("%s\n", controller.resolver().resolveName(args[0]).c_str());
        rc = kExitOk;
    } else if (command == "connect" && args.size() == 1) {
        auto address = normalizeConnectAddress(args[0], cfg.connect.default_port, cfg.connect.lan_prefix);
        if (!address) {
            fprintf(stderr, "%s\n", address.error().message.c_str());
            rc = kExitFailed;
        } else {
            const std::string target = address.value();
            rc = runCommand(controller, [&]() { return controller.connect(target); });
        }
    } else if (command == "disconnect" && args.size() == 1) {
        rc = runCommand(controller, [&]() { return controller.disconnect(args[0]); });
    } else if (command == "install" && args.size() >= 2) {
        rc = cmdInstall(controller, args[0], std::vector<std::string>(args.begin() + 1, args.end()));
    } else if (command == "uninstall" && args.size() == 2) {
        rc = runCommand(controller, [&]() { return controller.uninstall(args[0], args[1]); });
    } else if (command == "clear" && args.size() == 2) {
        rc = runCommand(controller, [&]() { return controller.clearData(args[0], args[1]); });
    } else if (command == "stop" && args.size() == 2) {
        rc = runCommand(controller, [&]() { return controller.forceStop(args[0], args[1]); });
    } else if (command == "diagnose" && args.size() == 2) {
        printf("%s\n", kDiagnosisHeader);
        for (const auto& line : controller.installer().diagnose(args[0], args[1])) {
            printf("  %s\n", line.c_str());
        }
        rc = kExitOk;
    } else {
        printUsage();
    }

    controller.waitIdle();
    fleet::log::closeLogFile();
    return rc;
}
