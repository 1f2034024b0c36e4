#pragma once

#include <string>
#include <vector>

namespace llvmsel {

// ============================================================================
// Process Execution
// ============================================================================

struct ProcessSpec {
    std::vector<std::string> argv;  // argv[0] is looked up on PATH
    std::string cwd;                // Empty: inherit
    bool quiet = false;             // Discard stdout/stderr
};

struct ExecResult {
    bool ok = false;     // Process was spawned and reaped
    int exit_code = -1;
    std::string error;
};

/// Spawn a process, wait for it, and report its exit code.
/// Signals are reported as 128 + signal number.
ExecResult run_process(const ProcessSpec& spec);

/// True if `command version_flag` runs and exits with 0
bool command_available(const std::string& command, const std::string& version_flag = "--version");

/// Render argv for log messages
std::string format_command(const std::vector<std::string>& argv);

} // namespace llvmsel
