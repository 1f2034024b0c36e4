#include "llvmsel/activator.hpp"
#include "llvmsel/platform.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace llvmsel {

namespace fs = std::filesystem;

SymlinkActivator::SymlinkActivator(const InstallationStore& store, const std::string& bin_dir)
    : Activator(store, absolute_path(bin_dir)) {}

std::string SymlinkActivator::linkPath() const {
    return join_path(bin_dir_, query_executable_name());
}

Result<void> SymlinkActivator::activate(const VersionKey& key) {
    auto ready = prepare(key);
    if (ready.isErr()) {
        return ready;
    }

    std::string target = store_.queryExecutablePath(key);
    std::string link = linkPath();

    auto result = atomic_update_symlink(link, target);
    if (!result.ok) {
        return Result<void>::err(filesystem_error(
            result.code, "failed to update " + link + ": " + result.error));
    }

    spdlog::info("Set {} to point to {}", link, target);
    return Result<void>::ok();
}

ActiveStatus SymlinkActivator::currentActive() const {
    std::string link = linkPath();

    if (!is_symlink(link)) {
        ActiveStatus status;
        if (path_exists(link)) {
            // A regular file we did not create
            status.state = ActiveState::Unrecognized;
            status.target = link;
        }
        return status;
    }

    auto target = read_symlink(link);
    if (!target) {
        ActiveStatus status;
        status.state = ActiveState::Unrecognized;
        status.target = link;
        return status;
    }

    fs::path resolved(*target);
    if (resolved.is_relative()) {
        resolved = fs::path(bin_dir_) / resolved;
    }
    return classifyTarget(resolved.lexically_normal().string());
}

} // namespace llvmsel
