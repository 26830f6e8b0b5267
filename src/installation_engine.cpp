#include "installation_engine.hpp"
#include "command_security.hpp"
#include "fleet_log.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace fleet {

namespace fs = std::filesystem;

namespace {

// Failures no other flag combination can fix
constexpr const char* FAST_FAIL_SIGNATURES[] = {
    "INSTALL_FAILED_ALREADY_EXISTS",
    "INSTALL_FAILED_UPDATE_INCOMPATIBLE",   // signed with a different certificate
    "INSTALL_FAILED_INVALID_APK",
    "INSTALL_FAILED_INSUFFICIENT_STORAGE",
};

bool hasApkSuffix(const std::string& path) {
    if (path.size() < 4) return false;
    std::string tail = path.substr(path.size() - 4);
    std::transform(tail.begin(), tail.end(), tail.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return tail == ".apk";
}

InstallOutcome rejected(std::string error) {
    InstallOutcome out;
    out.success = false;
    out.error = std::move(error);
    out.kind = ErrorKind::ValidationFailure;
    return out;
}

} // anonymous namespace

const std::vector<InstallationEngine::Strategy>& InstallationEngine::strategies() {
    // Most common success first
    static const std::vector<Strategy> ladder = {
        {"reinstall+downgrade",      "-r -d"},
        {"reinstall+test+downgrade", "-r -t -d"},
        {"reinstall",                "-r"},
        {"reinstall+test",           "-r -t"},
        {"plain",                    ""},
    };
    return ladder;
}

const char* InstallationEngine::findFastFailSignature(const std::string& text) {
    for (const char* sig : FAST_FAIL_SIGNATURES) {
        if (text.find(sig) != std::string::npos) return sig;
    }
    return nullptr;
}

Result<std::uintmax_t> InstallationEngine::validateArtifact(const std::string& artifact_path) {
    if (!hasApkSuffix(artifact_path)) {
        return Err<std::uintmax_t>(std::string(kInvalidArtifactError) + ": not an .apk file",
                                   ErrorKind::ValidationFailure);
    }

    std::error_code ec;
    std::uintmax_t size = fs::file_size(artifact_path, ec);
    if (ec) {
        return Err<std::uintmax_t>(std::string(kInvalidArtifactError) + ": " + ec.message(),
                                   ErrorKind::ValidationFailure);
    }
    if (size == 0) {
        return Err<std::uintmax_t>(std::string(kInvalidArtifactError) + ": empty file",
                                   ErrorKind::ValidationFailure);
    }

    std::ifstream file(artifact_path, std::ios::binary);
    char magic[2] = {0, 0};
    if (!file.is_open() || !file.read(magic, sizeof(magic))) {
        return Err<std::uintmax_t>(std::string(kInvalidArtifactError) + ": unreadable file",
                                   ErrorKind::ValidationFailure);
    }
    // APK is a ZIP archive
    if (magic[0] != 'P' || magic[1] != 'K') {
        return Err<std::uintmax_t>(std::string(kInvalidArtifactError) + ": not a ZIP archive",
                                   ErrorKind::ValidationFailure);
    }

    return Ok(size);
}

InstallOutcome InstallationEngine::install(const std::string& device_id, const std::string& artifact_path) const {
    std::error_code ec;
    if (!fs::exists(artifact_path, ec) || ec) {
        FLOG_ERROR("install", "Artifact not found: %s", artifact_path.c_str());
        return rejected(kArtifactNotFoundError);
    }

    if (!security::isValidDeviceId(device_id) || !registry_.isUsable(device_id)) {
        FLOG_ERROR("install", "Device %s is not connected", device_id.c_str());
        return rejected("device " + device_id + " is not connected or not usable");
    }

    auto valid = validateArtifact(artifact_path);
    if (!valid) {
        FLOG_ERROR("install", "%s (%s)", valid.error().message.c_str(), artifact_path.c_str());
        return rejected(valid.error().message);
    }

    FLOG_INFO("install", "Installing %s (%ju bytes) to %s",
              artifact_path.c_str(), valid.value(), device_id.c_str());

    InstallOutcome outcome;
    const auto& ladder = strategies();
    for (size_t i = 0; i < ladder.size(); ++i) {
        const Strategy& strategy = ladder[i];
        std::string flags = strategy.flags;
        std::string args = "-s " + device_id + " install " +
                           (flags.empty() ? "" : flags + " ") + security::quotePath(artifact_path);

        FLOG_INFO("install", "Strategy %zu/%zu (%s): install %s",
                  i + 1, ladder.size(), strategy.name, flags.c_str());
        CommandResult result = runner_.run(args, attempt_timeout_sec_);
        outcome.attempts++;
        outcome.strategy = flags;

        if (result.success) {
            FLOG_INFO("install", "Installed on %s with strategy '%s'", device_id.c_str(), strategy.name);
            outcome.success = true;
            outcome.output = result.output;
            outcome.error.reset();
            outcome.kind = ErrorKind::None;
            return outcome;
        }

        FLOG_WARN("install", "Strategy '%s' failed: %s", strategy.name, result.errorText().c_str());

        const char* sig = findFastFailSignature(result.errorText() + "\n" + result.outputText());
        if (sig) {
            FLOG_INFO("install", "Terminal failure %s; skipping remaining strategies", sig);
            outcome.success = false;
            outcome.output.reset();
            outcome.error = result.errorText().empty() ? result.outputText() : result.errorText();
            outcome.kind = result.kind;
            return outcome;
        }
    }

    FLOG_WARN("install", "All strategies failed for %s; running diagnosis", device_id.c_str());
    std::string report = std::string(kAllStrategiesFailedError) + "\n" + kDiagnosisHeader;
    for (const auto& line : diagnose(device_id, artifact_path)) {
        report += "\n" + line;
    }

    outcome.success = false;
    outcome.output.reset();
    outcome.error = report;
    outcome.kind = ErrorKind::ExecutionFailure;
    return outcome;
}

std::vector<std::string> InstallationEngine::diagnose(const std::string& device_id,
                                                      const std::string& artifact_path) const {
    std::vector<std::string> report;

    // 1. Artifact
    std::error_code ec;
    if (!fs::exists(artifact_path, ec) || ec) {
        report.push_back("[FAIL] package file missing");
    } else {
        report.push_back("[OK] package file exists");
        std::uintmax_t size = fs::file_size(artifact_path, ec);
        if (ec) {
            report.push_back("[WARN] package size unavailable: " + ec.message());
        } else {
            report.push_back("[INFO] package size: " + std::to_string(size) + " bytes");
        }
    }

    // 2. Device connectivity
    if (!registry_.isUsable(device_id)) {
        report.push_back("[FAIL] device not connected");
    } else {
        report.push_back("[OK] device connected");
        auto info = registry_.getDeviceInfo(device_id);
        report.push_back("[INFO] device model: " + info.model.value_or("unknown"));
        report.push_back("[INFO] Android version: " + info.android_version.value_or("unknown"));
    }

    // 3. Bridge service
    CommandResult version = runner_.run("version", runner_.controlTimeout());
    if (version.success) {
        report.push_back("[OK] bridge service responding");
        std::string first_line = version.outputText().substr(0, version.outputText().find('\n'));
        report.push_back("[INFO] bridge version: " + first_line);
    } else {
        report.push_back("[FAIL] bridge service not responding");
        report.push_back("[INFO] bridge error: " + version.errorText());
    }

    // 4. Device storage
    CommandResult storage = security::isValidDeviceId(device_id)
        ? runner_.run("-s " + device_id + " shell df /data", runner_.controlTimeout())
        : CommandResult::failure("invalid device id", ErrorKind::ValidationFailure);
    if (storage.success) {
        report.push_back("[OK] device storage accessible");
    } else {
        report.push_back("[WARN] device storage not accessible");
    }

    return report;
}

} // namespace fleet
