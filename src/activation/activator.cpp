#include "llvmsel/activator.hpp"
#include "llvmsel/platform.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace llvmsel {

namespace fs = std::filesystem;

const char* active_state_to_string(ActiveState state) {
    switch (state) {
        case ActiveState::None: return "none";
        case ActiveState::Active: return "active";
        case ActiveState::Dangling: return "dangling";
        case ActiveState::Unrecognized: return "unrecognized";
    }
    return "none";
}

std::optional<ActivationMechanism> parse_activation_mechanism(const std::string& name) {
    if (name == "symlink") return ActivationMechanism::Symlink;
    if (name == "shim") return ActivationMechanism::Shim;
    return std::nullopt;
}

ActiveStatus Activator::classifyTarget(const std::string& target) const {
    ActiveStatus status;
    status.target = target;
    status.state = ActiveState::Unrecognized;

    // Expected shape: <store root>/<version>-<type>/bin/<query executable>
    fs::path exe = fs::path(target).lexically_normal();
    fs::path bin = exe.parent_path();
    fs::path install_root = bin.parent_path();

    if (exe.filename().string() != query_executable_name() || bin.filename() != "bin") {
        return status;
    }
    if (install_root.parent_path() != fs::path(store_.root()).lexically_normal()) {
        return status;
    }

    auto key = parse_dir_name(install_root.filename().string());
    if (!key) {
        return status;
    }

    status.key = *key;
    status.state = store_.exists(*key) ? ActiveState::Active : ActiveState::Dangling;
    return status;
}

Result<void> Activator::prepare(const VersionKey& key) const {
    if (!store_.exists(key)) {
        return Result<void>::err(Error(ErrorCode::NOT_INSTALLED,
                                       "the specified library version is not currently installed: " +
                                       key.dir_name()));
    }

    if (!is_directory(bin_dir_)) {
        auto created = atomic_create_directory(bin_dir_);
        if (!created.ok) {
            return Result<void>::err(filesystem_error(created.code, created.error));
        }
    }

    return Result<void>::ok();
}

ActivationMechanism default_activation_mechanism() {
    if (get_current_platform() == Platform::Windows) {
        return ActivationMechanism::Shim;
    }
    return ActivationMechanism::Symlink;
}

std::unique_ptr<Activator> make_activator(ActivationMechanism mechanism,
                                          const InstallationStore& store,
                                          const std::string& bin_dir) {
    if (mechanism == ActivationMechanism::Shim) {
        ShimStyle style = get_current_platform() == Platform::Windows ? ShimStyle::Batch
                                                                      : ShimStyle::Shell;
        spdlog::debug("Using {} shim activation in {}",
                      style == ShimStyle::Batch ? "batch" : "shell", bin_dir);
        return std::make_unique<ShimActivator>(store, bin_dir, style);
    }

    spdlog::debug("Using symlink activation in {}", bin_dir);
    return std::make_unique<SymlinkActivator>(store, bin_dir);
}

} // namespace llvmsel
