#include "llvmsel/settings.hpp"
#include "llvmsel/download.hpp"
#include "llvmsel/platform.hpp"
#include "llvmsel/toolchain.hpp"

namespace llvmsel {

namespace {

std::string pick(const std::string& flag, const char* env_name, const std::string& fallback) {
    if (!flag.empty()) {
        return flag;
    }
    auto env = get_env(env_name);
    if (env && !env->empty()) {
        return *env;
    }
    return fallback;
}

} // namespace

std::string default_versions_root() {
    if (get_current_platform() == Platform::Windows) {
        auto exe_dir = get_executable_directory();
        std::string base = exe_dir ? get_parent_directory(*exe_dir) : std::string(".");
        return join_path(base, "versions");
    }
    return "/usr/local/llvm";
}

std::string default_bin_dir(const std::string& versions_root) {
    if (get_current_platform() == Platform::Windows) {
        return join_path(get_parent_directory(absolute_path(versions_root)), "bin");
    }
    return "/usr/local/bin";
}

Result<Settings> resolve_settings(const GlobalOptions& opts) {
    Settings settings;

    settings.versions_root = absolute_path(pick(opts.root, "LLVM_SELECT_ROOT", default_versions_root()));
    settings.bin_dir = absolute_path(
        pick(opts.bin_dir, "LLVM_SELECT_BIN_DIR", default_bin_dir(settings.versions_root)));
    settings.work_dir = absolute_path(pick(opts.work_dir, "LLVM_SELECT_WORK_DIR", "."));
    settings.mirror = pick(opts.mirror, "LLVM_SELECT_MIRROR", kDefaultMirror);

    auto location = parse_source_location(settings.mirror);
    if (location.type == LocationType::Invalid) {
        return Result<Settings>::err(Error(ErrorCode::INVALID_ARGUMENT,
                                           "invalid mirror \"" + settings.mirror + "\": " + location.error));
    }

    std::string mechanism = pick(opts.mechanism, "LLVM_SELECT_MECHANISM", "");
    if (mechanism.empty()) {
        settings.mechanism = default_activation_mechanism();
    } else {
        auto parsed = parse_activation_mechanism(mechanism);
        if (!parsed) {
            return Result<Settings>::err(Error(ErrorCode::INVALID_ARGUMENT,
                                               "unknown activation mechanism \"" + mechanism +
                                               "\" (expected symlink or shim)"));
        }
        // Windows has no unprivileged atomic symlink replacement
        if (*parsed == ActivationMechanism::Symlink &&
            get_current_platform() == Platform::Windows) {
            return Result<Settings>::err(Error(ErrorCode::INVALID_ARGUMENT,
                                               "the symlink activation mechanism is not supported "
                                               "on Windows (use shim)"));
        }
        settings.mechanism = *parsed;
    }

    return Result<Settings>::ok(settings);
}

} // namespace llvmsel
