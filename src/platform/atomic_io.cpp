#include "llvmsel/platform.hpp"

#include <cerrno>
#include <chrono>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#if defined(__APPLE__)
#include <mach-o/dyld.h>
#endif
#endif

namespace llvmsel {

namespace fs = std::filesystem;

Platform get_current_platform() {
#if defined(__APPLE__)
    return Platform::macOS;
#elif defined(_WIN32)
    return Platform::Windows;
#elif defined(__linux__)
    return Platform::Linux;
#else
    return Platform::Unknown;
#endif
}

std::string query_executable_name() {
    if (get_current_platform() == Platform::Windows) {
        return "llvm-config.exe";
    }
    return "llvm-config";
}

namespace {

std::error_code last_error() {
    return std::error_code(errno, std::generic_category());
}

// Generate a temporary sibling name for `base`
std::string make_temp_filename(const std::string& base) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string hex_chars = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[static_cast<size_t>(dis(gen))];
    }

    return base + ".tmp." + suffix;
}

#ifndef _WIN32
bool fsync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return false;

    bool result = fsync_fd(dir_fd);
    close(dir_fd);
    return result;
}
#endif

} // namespace

bool is_permission_error(const std::error_code& code) {
    return code == std::errc::permission_denied ||
           code == std::errc::operation_not_permitted ||
           code == std::errc::read_only_file_system;
}

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content,
                                    unsigned int mode) {
    AtomicWriteResult result;
    std::string temp_path = make_temp_filename(path);

#ifdef _WIN32
    (void)mode;
    std::ofstream temp_file(temp_path, std::ios::binary);
    if (!temp_file) {
        result.code = std::make_error_code(std::errc::permission_denied);
        result.error = "failed to create temp file: " + temp_path;
        return result;
    }

    temp_file.write(content.data(), static_cast<std::streamsize>(content.size()));
    temp_file.flush();
    bool written = temp_file.good();
    temp_file.close();
    if (!written || temp_file.fail()) {
        DeleteFileA(temp_path.c_str());
        result.code = std::make_error_code(std::errc::io_error);
        result.error = "failed to write content to " + temp_path;
        return result;
    }

    if (!MoveFileExA(temp_path.c_str(), path.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        DWORD err = GetLastError();
        DeleteFileA(temp_path.c_str());
        result.code = std::error_code(static_cast<int>(err), std::system_category());
        if (err == ERROR_ACCESS_DENIED) {
            result.code = std::make_error_code(std::errc::permission_denied);
        }
        result.error = "failed to rename temp file over " + path;
        return result;
    }

    result.ok = true;
#else
    // POSIX: temp + fsync(file) + rename + fsync(dir)
    std::string dir_path = get_parent_directory(path);

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, static_cast<mode_t>(mode));
    if (fd < 0) {
        result.code = last_error();
        result.error = "failed to create temp file: " + result.code.message();
        return result;
    }

    ssize_t written = write(fd, content.data(), content.size());
    if (written < 0 || static_cast<size_t>(written) != content.size()) {
        result.code = last_error();
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to write content";
        return result;
    }

    // open() applies the umask; the final mode must be exact for shims
    if (fchmod(fd, static_cast<mode_t>(mode)) != 0) {
        result.code = last_error();
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to set mode on temp file: " + result.code.message();
        return result;
    }

    if (!fsync_fd(fd)) {
        result.code = last_error();
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to fsync temp file";
        return result;
    }

    close(fd);

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        result.code = last_error();
        unlink(temp_path.c_str());
        result.error = "failed to rename temp file: " + result.code.message();
        return result;
    }

    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }

    result.ok = true;
#endif

    return result;
}

AtomicWriteResult atomic_create_directory(const std::string& path) {
    AtomicWriteResult result;

    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        result.code = ec;
        result.error = "failed to create directory " + path + ": " + ec.message();
        return result;
    }

#ifndef _WIN32
    std::string parent = get_parent_directory(path);
    if (!parent.empty()) {
        fsync_directory(parent);
    }
#endif

    result.ok = true;
    return result;
}

AtomicWriteResult atomic_update_symlink(const std::string& link_path, const std::string& target) {
    AtomicWriteResult result;

#ifdef _WIN32
    std::string temp_path = make_temp_filename(link_path);

    std::error_code ec;
    fs::create_symlink(target, temp_path, ec);
    if (ec) {
        result.code = ec;
        result.error = "failed to create symlink: " + ec.message();
        return result;
    }

    // MoveFileExA moves the link itself, never its target
    if (!MoveFileExA(temp_path.c_str(), link_path.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        DWORD err = GetLastError();
        std::error_code cleanup_ec;
        fs::remove(temp_path, cleanup_ec);
        result.code = std::error_code(static_cast<int>(err), std::system_category());
        if (err == ERROR_ACCESS_DENIED) {
            result.code = std::make_error_code(std::errc::permission_denied);
        }
        result.error = "failed to rename symlink over " + link_path;
        return result;
    }

    result.ok = true;
#else
    std::string temp_path = make_temp_filename(link_path);

    if (symlink(target.c_str(), temp_path.c_str()) != 0) {
        result.code = last_error();
        result.error = "failed to create symlink: " + result.code.message();
        return result;
    }

    if (rename(temp_path.c_str(), link_path.c_str()) != 0) {
        result.code = last_error();
        unlink(temp_path.c_str());
        result.error = "failed to rename symlink: " + result.code.message();
        return result;
    }

    std::string parent = get_parent_directory(link_path);
    if (!parent.empty()) {
        fsync_directory(parent);
    }

    result.ok = true;
#endif

    return result;
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string get_filename(const std::string& path) {
    fs::path p(path);
    return p.filename().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return p.string();
}

std::string absolute_path(const std::string& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    if (ec) {
        return fs::path(path).lexically_normal().string();
    }
    std::string normalized = abs.lexically_normal().string();
    // lexically_normal keeps a trailing separator
    while (normalized.size() > 1 && (normalized.back() == '/' || normalized.back() == '\\')) {
        normalized.pop_back();
    }
    return normalized;
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool is_symlink(const std::string& path) {
    std::error_code ec;
    return fs::is_symlink(path, ec);
}

std::optional<std::string> read_symlink(const std::string& path) {
    std::error_code ec;
    auto target = fs::read_symlink(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return target.string();
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::vector<std::string> list_directory(const std::string& path) {
    std::vector<std::string> entries;

    std::error_code ec;
    if (!fs::is_directory(path, ec)) return entries;

    for (const auto& entry : fs::directory_iterator(path, ec)) {
        entries.push_back(entry.path().filename().string());
    }

    return entries;
}

bool remove_directory(const std::string& path, std::error_code& ec) {
    ec.clear();
    fs::remove_all(path, ec);
    return !ec;
}

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* val = nullptr;
    size_t len = 0;
    if (_dupenv_s(&val, &len, name.c_str()) == 0 && val != nullptr) {
        std::string result(val);
        free(val);
        return result;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
#endif
}

std::optional<std::string> get_executable_directory() {
#if defined(_WIN32)
    char buf[MAX_PATH];
    DWORD len = GetModuleFileNameA(nullptr, buf, MAX_PATH);
    if (len == 0 || len == MAX_PATH) {
        return std::nullopt;
    }
    return get_parent_directory(std::string(buf, len));
#elif defined(__APPLE__)
    char buf[PATH_MAX];
    uint32_t size = sizeof(buf);
    if (_NSGetExecutablePath(buf, &size) != 0) {
        return std::nullopt;
    }
    return get_parent_directory(absolute_path(buf));
#else
    std::error_code ec;
    auto exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return std::nullopt;
    }
    return exe.parent_path().string();
#endif
}

std::string get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

} // namespace llvmsel
