#include "llvmsel/installation_store.hpp"
#include "llvmsel/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace llvmsel {

InstallationStore::InstallationStore(const std::string& root)
    : root_(absolute_path(root)) {}

std::vector<InstalledVersion> InstallationStore::list() const {
    std::vector<InstalledVersion> versions;

    auto names = list_directory(root_);
    std::sort(names.begin(), names.end());

    for (const auto& name : names) {
        std::string entry_path = join_path(root_, name);
        if (!is_directory(entry_path)) continue;

        auto key = parse_dir_name(name);
        if (!key) {
            spdlog::debug("Skipping {}: not a VERSION-BUILDTYPE directory", entry_path);
            continue;
        }

        if (!hasValidLayout(entry_path)) {
            spdlog::debug("Skipping {}: no bin/{}", entry_path, query_executable_name());
            continue;
        }

        InstalledVersion installed;
        installed.key = *key;
        installed.root = entry_path;
        versions.push_back(std::move(installed));
    }

    return versions;
}

std::string InstallationStore::resolvePath(const VersionKey& key) const {
    return join_path(root_, key.dir_name());
}

std::string InstallationStore::queryExecutablePath(const VersionKey& key) const {
    return join_path(join_path(resolvePath(key), "bin"), query_executable_name());
}

bool InstallationStore::exists(const VersionKey& key) const {
    return hasValidLayout(resolvePath(key));
}

Result<void> InstallationStore::remove(const VersionKey& key) {
    if (!exists(key)) {
        return Result<void>::err(Error(ErrorCode::NOT_INSTALLED,
                                       "version not installed: " + key.dir_name()));
    }

    std::string path = resolvePath(key);
    std::error_code ec;
    if (!remove_directory(path, ec)) {
        return Result<void>::err(filesystem_error(
            ec, "failed to remove " + path + ": " + ec.message()));
    }

    spdlog::info("Removed {}", path);
    return Result<void>::ok();
}

bool InstallationStore::hasValidLayout(const std::string& install_root) {
    std::string bin_dir = join_path(install_root, "bin");
    if (!is_directory(bin_dir)) {
        return false;
    }
    return is_regular_file(join_path(bin_dir, query_executable_name()));
}

} // namespace llvmsel
