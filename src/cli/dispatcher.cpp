#include "llvmsel/dispatcher.hpp"
#include "llvmsel/install_receipt.hpp"
#include "llvmsel/release.hpp"

namespace llvmsel {

ExitCode exit_code_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::NOT_INSTALLED: return ExitCode::NotInstalled;
        case ErrorCode::ALREADY_INSTALLED: return ExitCode::AlreadyInstalled;
        case ErrorCode::FETCH_FAILURE: return ExitCode::FetchFailure;
        case ErrorCode::BUILD_FAILURE: return ExitCode::BuildFailure;
        case ErrorCode::PERMISSION_DENIED: return ExitCode::PermissionDenied;
        case ErrorCode::INVALID_ARGUMENT: return ExitCode::InvalidArgument;
        case ErrorCode::IO_ERROR: return ExitCode::IoError;
    }
    return ExitCode::IoError;
}

int CommandDispatcher::run(const Command& command) {
    if (command.action == Action::List) {
        return runList();
    }
    if (command.action == Action::Current) {
        return runCurrent();
    }

    auto key = validate(command);
    if (key.isErr()) {
        return fail(key.error());
    }

    switch (command.action) {
        case Action::Install: return runInstall(command, key.value());
        case Action::Remove: return runRemove(key.value());
        default: return runActivate(key.value());
    }
}

Result<VersionKey> CommandDispatcher::validate(const Command& command) const {
    auto build_type = parse_build_type(command.build_type);
    if (!build_type) {
        return Result<VersionKey>::err(Error(ErrorCode::INVALID_ARGUMENT,
                                             "invalid build type \"" + command.build_type +
                                             "\" (valid build types: " + build_type_list() + ")"));
    }

    if (command.version.empty()) {
        return Result<VersionKey>::err(Error(ErrorCode::INVALID_ARGUMENT,
                                             "you must specify an LLVM version."));
    }

    auto release = LlvmRelease::parse(command.version);
    if (!release) {
        return Result<VersionKey>::err(Error(ErrorCode::INVALID_ARGUMENT,
                                             "unsupported LLVM version \"" + command.version + "\"."));
    }

    VersionKey key;
    key.version = release->toString();
    key.build_type = *build_type;
    return Result<VersionKey>::ok(key);
}

int CommandDispatcher::runList() {
    auto versions = store_.list();
    auto active = activator_.currentActive();

    nlohmann::json j;
    j["ok"] = true;
    j["versions"] = nlohmann::json::array();
    for (const auto& installed : versions) {
        nlohmann::json entry;
        entry["name"] = installed.key.dir_name();
        entry["version"] = installed.key.version;
        entry["build_type"] = build_type_to_string(installed.key.build_type);
        entry["path"] = installed.root;
        entry["active"] = active.state == ActiveState::Active && active.key == installed.key;
        if (auto receipt = read_install_receipt(installed.root)) {
            entry["installed_at"] = receipt->installed_at;
        }
        j["versions"].push_back(entry);
    }
    j["active"] = activeToJson(active);

    if (json_) {
        out_ << j.dump(2) << std::endl;
        return static_cast<int>(ExitCode::Ok);
    }

    if (versions.empty()) {
        out_ << "There are no library versions currently installed." << std::endl;
    } else {
        out_ << "Installed library versions:" << std::endl;
        for (const auto& installed : versions) {
            bool is_active = active.state == ActiveState::Active && active.key == installed.key;
            out_ << (is_active ? "* " : "  ") << installed.key.dir_name() << std::endl;
        }
    }

    if (active.state == ActiveState::Dangling) {
        out_ << "Active version " << active.key->dir_name()
             << " is no longer installed (dangling " << activator_.linkPath() << ")" << std::endl;
    } else if (active.state == ActiveState::Unrecognized) {
        out_ << activator_.linkPath() << " is not managed by llvm-select (target: "
             << active.target << ")" << std::endl;
    }

    return static_cast<int>(ExitCode::Ok);
}

int CommandDispatcher::runCurrent() {
    auto active = activator_.currentActive();

    if (json_) {
        nlohmann::json j;
        j["ok"] = true;
        j["active"] = activeToJson(active);
        out_ << j.dump(2) << std::endl;
        return static_cast<int>(ExitCode::Ok);
    }

    switch (active.state) {
        case ActiveState::None:
            out_ << "none" << std::endl;
            break;
        case ActiveState::Active:
            out_ << active.key->dir_name() << std::endl;
            break;
        case ActiveState::Dangling:
            out_ << "dangling: " << active.key->dir_name() << std::endl;
            break;
        case ActiveState::Unrecognized:
            out_ << "unrecognized: " << active.target << std::endl;
            break;
    }
    return static_cast<int>(ExitCode::Ok);
}

int CommandDispatcher::runInstall(const Command& command, const VersionKey& key) {
    BuildRequest request;
    request.key = key;
    request.source_location = settings_.mirror;
    request.work_dir = settings_.work_dir;
    request.checksums_file = command.checksums_file;
    request.keep_sources = command.keep_sources;

    auto result = builder_.install(request);
    if (result.isErr()) {
        return fail(result.error());
    }

    nlohmann::json j;
    j["ok"] = true;
    j["installed"]["name"] = key.dir_name();
    j["installed"]["path"] = result.value().root;
    printSuccess("Library installed to: " + result.value().root, j);
    return static_cast<int>(ExitCode::Ok);
}

int CommandDispatcher::runRemove(const VersionKey& key) {
    std::string path = store_.resolvePath(key);

    auto result = store_.remove(key);
    if (result.isErr()) {
        return fail(result.error());
    }

    nlohmann::json j;
    j["ok"] = true;
    j["removed"]["name"] = key.dir_name();
    j["removed"]["path"] = path;
    printSuccess("Removed `" + path + "`.", j);
    return static_cast<int>(ExitCode::Ok);
}

int CommandDispatcher::runActivate(const VersionKey& key) {
    auto result = activator_.activate(key);
    if (result.isErr()) {
        return fail(result.error());
    }

    std::string target = store_.queryExecutablePath(key);
    nlohmann::json j;
    j["ok"] = true;
    j["active"]["name"] = key.dir_name();
    j["active"]["target"] = target;
    j["active"]["link"] = activator_.linkPath();
    printSuccess("Set llvm-config to point to `" + target + "`.", j);
    return static_cast<int>(ExitCode::Ok);
}

int CommandDispatcher::fail(const Error& error) {
    if (json_) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = error.message();
        j["code"] = error_code_to_string(error.code());
        out_ << j.dump(2) << std::endl;
    } else {
        err_ << "Error: " << error.message() << std::endl;
    }
    return static_cast<int>(exit_code_for(error.code()));
}

void CommandDispatcher::printSuccess(const std::string& message, const nlohmann::json& j) {
    if (json_) {
        out_ << j.dump(2) << std::endl;
    } else {
        out_ << message << std::endl;
    }
}

nlohmann::json CommandDispatcher::activeToJson(const ActiveStatus& status) const {
    nlohmann::json j;
    j["state"] = active_state_to_string(status.state);
    j["link"] = activator_.linkPath();
    if (status.key) {
        j["name"] = status.key->dir_name();
    }
    if (!status.target.empty()) {
        j["target"] = status.target;
    }
    return j;
}

} // namespace llvmsel
