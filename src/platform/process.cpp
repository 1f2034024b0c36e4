#include "llvmsel/process.hpp"

#include <cstring>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <sys/wait.h>
#endif

namespace llvmsel {

std::string format_command(const std::vector<std::string>& argv) {
    std::string cmd;
    for (size_t i = 0; i < argv.size(); i++) {
        if (i > 0) cmd += " ";

        bool needs_quotes = argv[i].find(' ') != std::string::npos ||
                            argv[i].find('\t') != std::string::npos;

        if (needs_quotes) cmd += "\"";
        cmd += argv[i];
        if (needs_quotes) cmd += "\"";
    }
    return cmd;
}

// ============================================================================
// UNIX EXECUTION
// ============================================================================

#ifndef _WIN32

ExecResult run_process(const ProcessSpec& spec) {
    ExecResult result;

    if (spec.argv.empty()) {
        result.error = "empty command";
        return result;
    }

    std::vector<char*> argv;
    for (const auto& s : spec.argv) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();

    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (pid == 0) {
        // Child process
        if (!spec.cwd.empty()) {
            if (chdir(spec.cwd.c_str()) != 0) {
                _exit(127);
            }
        }

        if (spec.quiet) {
            int devnull = open("/dev/null", O_WRONLY);
            if (devnull >= 0) {
                dup2(devnull, STDOUT_FILENO);
                dup2(devnull, STDERR_FILENO);
                close(devnull);
            }
        }

        execvp(argv[0], argv.data());

        // If execvp returns, it failed
        _exit(127);
    }

    int status;
    if (waitpid(pid, &status, 0) == -1) {
        result.error = "waitpid failed: " + std::string(strerror(errno));
        return result;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }

    return result;
}

#endif // !_WIN32

// ============================================================================
// WINDOWS EXECUTION
// ============================================================================

#ifdef _WIN32

ExecResult run_process(const ProcessSpec& spec) {
    ExecResult result;

    if (spec.argv.empty()) {
        result.error = "empty command";
        return result;
    }

    std::string cmd_line = format_command(spec.argv);

    STARTUPINFOA si = {0};
    si.cb = sizeof(si);

    HANDLE null_handle = INVALID_HANDLE_VALUE;
    if (spec.quiet) {
        SECURITY_ATTRIBUTES sa = {sizeof(sa), nullptr, TRUE};
        null_handle = CreateFileA("NUL", GENERIC_WRITE, FILE_SHARE_WRITE, &sa,
                                  OPEN_EXISTING, 0, nullptr);
        if (null_handle != INVALID_HANDLE_VALUE) {
            si.dwFlags |= STARTF_USESTDHANDLES;
            si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
            si.hStdOutput = null_handle;
            si.hStdError = null_handle;
        }
    }

    PROCESS_INFORMATION pi = {0};

    BOOL success = CreateProcessA(
        nullptr,  // Search PATH using the command line
        const_cast<char*>(cmd_line.c_str()),
        nullptr,
        nullptr,
        null_handle != INVALID_HANDLE_VALUE ? TRUE : FALSE,
        0,
        nullptr,  // Inherit environment
        spec.cwd.empty() ? nullptr : spec.cwd.c_str(),
        &si,
        &pi
    );

    if (null_handle != INVALID_HANDLE_VALUE) {
        CloseHandle(null_handle);
    }

    if (!success) {
        result.error = "CreateProcess failed: " + std::to_string(GetLastError());
        return result;
    }

    WaitForSingleObject(pi.hProcess, INFINITE);

    DWORD exit_code;
    if (GetExitCodeProcess(pi.hProcess, &exit_code)) {
        result.exit_code = static_cast<int>(exit_code);
        result.ok = true;
    } else {
        result.error = "GetExitCodeProcess failed";
    }

    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);

    return result;
}

#endif // _WIN32

bool command_available(const std::string& command, const std::string& version_flag) {
    ProcessSpec spec;
    spec.argv = {command, version_flag};
    spec.quiet = true;
    auto result = run_process(spec);
    return result.ok && result.exit_code == 0;
}

} // namespace llvmsel
