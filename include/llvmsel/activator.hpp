#pragma once

/**
 * @file activator.hpp
 * @brief Redirection of the well-known llvm-config command to one installation
 *
 * The active version is a single on-disk artifact in the bin directory.
 * Every variant replaces it by writing a sibling temp artifact and renaming
 * it over the old one, so concurrent invokers never see it missing.
 */

#include "llvmsel/error.hpp"
#include "llvmsel/installation_store.hpp"
#include "llvmsel/version_key.hpp"

#include <memory>
#include <optional>
#include <string>

namespace llvmsel {

enum class ActiveState {
    None,          // No redirection artifact
    Active,        // Artifact resolves to an existing installation
    Dangling,      // Artifact resolves to a key that is no longer installed
    Unrecognized,  // Artifact exists but does not point into the store
};

const char* active_state_to_string(ActiveState state);

struct ActiveStatus {
    ActiveState state = ActiveState::None;
    std::optional<VersionKey> key;  // Set for Active and Dangling
    std::string target;             // Raw artifact target, if any
};

enum class ActivationMechanism {
    Symlink,
    Shim,
};

std::optional<ActivationMechanism> parse_activation_mechanism(const std::string& name);

// ============================================================================
// Activator interface
// ============================================================================

class Activator {
public:
    virtual ~Activator() = default;

    /// Redirect the well-known command to key's query executable.
    /// NOT_INSTALLED leaves the existing artifact untouched.
    virtual Result<void> activate(const VersionKey& key) = 0;

    /// Inspect the artifact; never fails
    virtual ActiveStatus currentActive() const = 0;

    /// Location of the redirection artifact
    virtual std::string linkPath() const = 0;

protected:
    Activator(const InstallationStore& store, std::string bin_dir)
        : store_(store), bin_dir_(std::move(bin_dir)) {}

    /// Map an artifact's target executable path back to a store key
    ActiveStatus classifyTarget(const std::string& target) const;

    /// NOT_INSTALLED unless key exists; ensures bin_dir is present
    Result<void> prepare(const VersionKey& key) const;

    const InstallationStore& store_;
    std::string bin_dir_;
};

// ============================================================================
// Symlink variant (Linux, macOS)
// ============================================================================

// bin_dir/llvm-config -> <root>/<version>-<type>/bin/llvm-config
class SymlinkActivator : public Activator {
public:
    SymlinkActivator(const InstallationStore& store, const std::string& bin_dir);

    Result<void> activate(const VersionKey& key) override;
    ActiveStatus currentActive() const override;
    std::string linkPath() const override;
};

// ============================================================================
// Shim variant (Windows; optional elsewhere)
// ============================================================================

enum class ShimStyle {
    Batch,  // llvm-config.cmd: @echo off / "<exe>" %*
    Shell,  // llvm-config:     #!/bin/sh / exec '<exe>' "$@"
};

class ShimActivator : public Activator {
public:
    ShimActivator(const InstallationStore& store, const std::string& bin_dir, ShimStyle style);

    Result<void> activate(const VersionKey& key) override;
    ActiveStatus currentActive() const override;
    std::string linkPath() const override;

    /// Script text forwarding all arguments to `executable`
    static std::string renderShim(ShimStyle style, const std::string& executable);

    /// Target of a shim script: the single-quoted word after `exec` (shell style)
    /// or the first double-quoted string (batch style)
    static std::optional<std::string> parseShimTarget(const std::string& script);

private:
    ShimStyle style_;
};

/// The platform's default mechanism: Shim on Windows, Symlink elsewhere
ActivationMechanism default_activation_mechanism();

/// Construct the activator for a mechanism. Shim uses Batch on Windows and Shell elsewhere.
std::unique_ptr<Activator> make_activator(ActivationMechanism mechanism,
                                          const InstallationStore& store,
                                          const std::string& bin_dir);

} // namespace llvmsel
