#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include "command_runner.hpp"
#include "device_registry.hpp"
#include "result.hpp"

namespace fleet {

constexpr int kInstallAttemptTimeoutSec = 30;

constexpr const char* kArtifactNotFoundError = "artifact not found";
constexpr const char* kInvalidArtifactError = "invalid artifact";
constexpr const char* kAllStrategiesFailedError = "all install strategies failed";
constexpr const char* kDiagnosisHeader = "Install diagnosis:";

/**
 * Result of one install() call.
 * On exhaustion `error` holds the failure line, the diagnosis header and one
 * line per diagnostic fact.
 */
struct InstallOutcome {
    bool success = false;
    std::optional<std::string> output;
    std::optional<std::string> error;
    ErrorKind kind = ErrorKind::None;
    int attempts = 0;              // install invocations actually issued
    std::string strategy;          // flags of the strategy that decided the outcome

    std::string errorText() const { return error.value_or(""); }
};

/**
 * Installation Engine
 * Installs an APK through an ordered ladder of `adb install` flag sets.
 * Strategies run strictly one after another; the first success wins and a
 * terminal failure signature stops the ladder early.
 */
class InstallationEngine {
public:
    struct Strategy {
        const char* name;
        const char* flags;
    };

    InstallationEngine(const CommandRunner& runner, const DeviceRegistry& registry,
                       int attempt_timeout_sec = kInstallAttemptTimeoutSec)
        : runner_(runner), registry_(registry), attempt_timeout_sec_(attempt_timeout_sec) {}

    InstallOutcome install(const std::string& device_id, const std::string& artifact_path) const;

    // Read-only checks, one report line per fact; never throws
    std::vector<std::string> diagnose(const std::string& device_id, const std::string& artifact_path) const;

    // Suffix, non-empty, "PK" magic. Returns the file size on success.
    static Result<std::uintmax_t> validateArtifact(const std::string& artifact_path);

    // Terminal install failure markers found in `text`, or nullptr
    static const char* findFastFailSignature(const std::string& text);

    static const std::vector<Strategy>& strategies();

private:
    const CommandRunner& runner_;
    const DeviceRegistry& registry_;
    int attempt_timeout_sec_;
};

} // namespace fleet
