/**
 * @file test_helpers.hpp
 * @brief Temp directories and fake installations shared by the test suite
 */

#pragma once

#include <llvmsel/platform.hpp>
#include <llvmsel/version_key.hpp>

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>

#ifndef _WIN32
#include <sys/wait.h>
#endif

namespace llvmsel::test {

namespace fs = std::filesystem;

/**
 * Unique directory under the system temp dir, removed on destruction.
 */
class TempTestDir {
public:
    explicit TempTestDir(const std::string& prefix = "llvmsel_test") {
        static std::atomic<unsigned> counter{0};
        std::srand(static_cast<unsigned>(std::time(nullptr)));
        std::string unique_name = prefix + "_" + std::to_string(std::time(nullptr)) + "_" +
                                  std::to_string(std::rand()) + "_" + std::to_string(counter++);
        base_path_ = fs::temp_directory_path() / unique_name;
        fs::create_directories(base_path_);
    }

    ~TempTestDir() {
        std::error_code ec;
        fs::permissions(base_path_, fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(base_path_, ec);
    }

    TempTestDir(const TempTestDir&) = delete;
    TempTestDir& operator=(const TempTestDir&) = delete;

    std::string path() const { return base_path_.string(); }
    std::string path(const std::string& rel) const { return (base_path_ / rel).string(); }

private:
    fs::path base_path_;
};

inline void write_text_file(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream(path, std::ios::binary) << content;
}

inline std::string read_text_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

/**
 * Create <install_root>/bin/<query executable> as a shell script that prints
 * `reported_version` for --version.
 */
inline std::string make_fake_llvm_config(const std::string& install_root,
                                         const std::string& reported_version) {
    std::string exe = (fs::path(install_root) / "bin" / query_executable_name()).string();
    write_text_file(exe, "#!/bin/sh\n"
                         "if [ \"$1\" = \"--version\" ]; then echo " + reported_version + "; fi\n");
    fs::permissions(exe, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                             fs::perms::others_read | fs::perms::others_exec);
    return exe;
}

/// Fake installation of `key` under the versions root
inline std::string make_fake_installation(const std::string& versions_root, const VersionKey& key) {
    std::string root = (fs::path(versions_root) / key.dir_name()).string();
    make_fake_llvm_config(root, key.version);
    return root;
}

inline VersionKey make_key(const std::string& version, BuildType build_type = BuildType::Release) {
    VersionKey key;
    key.version = version;
    key.build_type = build_type;
    return key;
}

/// Run a shell command and capture its stdout; nullopt if it exits non-zero
inline std::optional<std::string> run_and_capture(const std::string& command) {
#ifdef _WIN32
    FILE* pipe = _popen(command.c_str(), "r");
#else
    FILE* pipe = popen(command.c_str(), "r");
#endif
    if (!pipe) return std::nullopt;

    std::string output;
    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe)) {
        output += buffer;
    }
#ifdef _WIN32
    int status = _pclose(pipe);
#else
    int status = pclose(pipe);
#endif
    if (status != 0) return std::nullopt;

    while (!output.empty() && (output.back() == '\n' || output.back() == '\r')) {
        output.pop_back();
    }
    return output;
}

#ifndef _WIN32
/// Quote a word for /bin/sh
inline std::string shell_quote(const std::string& word) {
    std::string quoted = "'";
    for (char c : word) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
}

struct CommandOutput {
    int exit_code = -1;
    std::string output;
};

/// Run a shell command, keeping its exit status and trimmed stdout
inline CommandOutput run_command(const std::string& command) {
    CommandOutput result;
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) return result;

    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe)) {
        result.output += buffer;
    }
    int status = pclose(pipe);
    if (status != -1 && WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }

    while (!result.output.empty() && result.output.back() == '\n') {
        result.output.pop_back();
    }
    return result;
}
#endif

/**
 * Set an environment variable for the lifetime of the object.
 */
class ScopedEnv {
public:
    ScopedEnv(const std::string& name, const std::optional<std::string>& value) : name_(name) {
        if (const char* old = std::getenv(name.c_str())) {
            previous_ = std::string(old);
        }
        apply(value);
    }

    ~ScopedEnv() { apply(previous_); }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    void apply(const std::optional<std::string>& value) {
#ifdef _WIN32
        _putenv_s(name_.c_str(), value ? value->c_str() : "");
#else
        if (value) {
            setenv(name_.c_str(), value->c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
#endif
    }

    std::string name_;
    std::optional<std::string> previous_;
};

} // namespace llvmsel::test
