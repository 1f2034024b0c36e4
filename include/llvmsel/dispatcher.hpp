#pragma once

/**
 * @file dispatcher.hpp
 * @brief Maps parsed commands onto the store, builder and activator
 *
 * The only layer that turns component errors into exit codes and messages.
 */

#include "llvmsel/activator.hpp"
#include "llvmsel/builder.hpp"
#include "llvmsel/error.hpp"
#include "llvmsel/installation_store.hpp"
#include "llvmsel/settings.hpp"

#include <nlohmann/json.hpp>

#include <ostream>
#include <string>

namespace llvmsel {

enum class ExitCode : int {
    Ok = 0,
    IoError = 1,
    InvalidArgument = 2,
    NotInstalled = 3,
    AlreadyInstalled = 4,
    FetchFailure = 5,
    BuildFailure = 6,
    PermissionDenied = 7,
};

ExitCode exit_code_for(ErrorCode code);

enum class Action {
    Activate,  // VERSION [BUILDTYPE]
    Install,   // install VERSION [BUILDTYPE]
    Remove,    // --remove VERSION [BUILDTYPE]
    List,      // --list
    Current,   // --current
};

struct Command {
    Action action = Action::Activate;
    std::string version;
    std::string build_type = "Release";
    std::string checksums_file;   // install only
    bool keep_sources = false;    // install only (--no-cleanup)
};

class CommandDispatcher {
public:
    CommandDispatcher(InstallationStore& store, Activator& activator, Builder& builder,
                      const Settings& settings, bool json, std::ostream& out, std::ostream& err)
        : store_(store), activator_(activator), builder_(builder), settings_(settings),
          json_(json), out_(out), err_(err) {}

    /// Run a command and return the process exit code
    int run(const Command& command);

private:
    Result<VersionKey> validate(const Command& command) const;

    int runList();
    int runCurrent();
    int runInstall(const Command& command, const VersionKey& key);
    int runRemove(const VersionKey& key);
    int runActivate(const VersionKey& key);

    int fail(const Error& error);
    void printSuccess(const std::string& message, const nlohmann::json& j);
    nlohmann::json activeToJson(const ActiveStatus& status) const;

    InstallationStore& store_;
    Activator& activator_;
    Builder& builder_;
    const Settings& settings_;
    bool json_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace llvmsel
