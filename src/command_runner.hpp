#pragma once
#include <string>
#include <optional>
#include <functional>
#include "result.hpp"

namespace fleet {

// Per-call time budgets (seconds)
constexpr int kControlTimeoutSec = 30;
constexpr int kCaptureTimeoutSec = 60;
constexpr int kPullTimeoutSec = 120;

constexpr const char* kToolNotFoundError = "bridge tool not found";
constexpr const char* kTimedOutError = "timed out";

/**
 * Raw outcome of one child process.
 */
struct ProcessOutput {
    bool launched = false;        // false: process could not be started
    bool timed_out = false;       // killed after the time budget elapsed
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    std::string launch_error;     // reason when launched == false
};

// Starts `command_line` through the platform shell and waits up to timeout_sec.
// Replaceable so tests can script tool behaviour.
using ProcessLauncher = std::function<ProcessOutput(const std::string& command_line, int timeout_sec)>;

// Default launcher: real child process with separate stdout/stderr pipes
ProcessOutput launchProcess(const std::string& command_line, int timeout_sec);

/**
 * Normalized result of a bridge (or system) command.
 * success == true  -> output holds trimmed stdout
 * success == false -> error holds the reason, output may hold partial stdout
 */
struct CommandResult {
    bool success = false;
    std::optional<std::string> output;
    std::optional<std::string> error;
    ErrorKind kind = ErrorKind::None;

    static CommandResult ok(std::string out) {
        CommandResult r;
        r.success = true;
        r.output = std::move(out);
        return r;
    }

    static CommandResult failure(std::string err, ErrorKind k,
                                 std::optional<std::string> out = std::nullopt) {
        CommandResult r;
        r.success = false;
        r.error = std::move(err);
        r.output = std::move(out);
        r.kind = k;
        return r;
    }

    std::string outputText() const { return output.value_or(""); }
    std::string errorText() const { return error.value_or(""); }
};

// Strip leading/trailing whitespace (spaces, tabs, CR, LF)
std::string trimCopy(const std::string& s);

/**
 * CommandRunner
 * Invokes the external bridge executable (adb) and classifies the outcome.
 * The bridge path is resolved once at construction; an empty path means the
 * tool is unavailable and every run() fails without spawning anything.
 */
class CommandRunner {
public:
    explicit CommandRunner(std::string bridge_path, ProcessLauncher launcher = launchProcess,
                           int control_timeout_sec = kControlTimeoutSec);

    // Deterministic lookup: override_path if given, else <exe dir>/adb/adb[.exe].
    // Returns empty string when nothing usable exists.
    static std::string locateBridge(const std::string& override_path = "");

    // Run `<bridge> <args>`
    CommandResult run(const std::string& args, int timeout_sec = kControlTimeoutSec) const;

    // Run a non-bridge command line (e.g. the neighbor-discovery scan)
    CommandResult runSystem(const std::string& command_line, int timeout_sec = kControlTimeoutSec) const;

    bool bridgeAvailable() const { return !bridge_path_.empty(); }
    const std::string& bridgePath() const { return bridge_path_; }

    // Budget for short control calls (devices, connect, getprop, ...)
    int controlTimeout() const { return control_timeout_sec_; }

private:
    CommandResult execute(const std::string& command_line, int timeout_sec) const;

    std::string bridge_path_;
    ProcessLauncher launcher_;
    int control_timeout_sec_;
};

} // namespace fleet
