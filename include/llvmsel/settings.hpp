#pragma once

#include "llvmsel/activator.hpp"
#include "llvmsel/error.hpp"

#include <string>

namespace llvmsel {

/**
 * Global options available to all commands. Empty strings mean "not given".
 */
struct GlobalOptions {
    std::string root;       // --root
    std::string bin_dir;    // --bin-dir
    std::string work_dir;   // --work-dir
    std::string mirror;     // --mirror
    std::string mechanism;  // --mechanism
    bool json = false;      // --json
    bool verbose = false;   // -v, --verbose
    bool quiet = false;     // -q, --quiet
};

/**
 * Resolved locations and behavior for one invocation.
 */
struct Settings {
    std::string versions_root;
    std::string bin_dir;
    std::string work_dir;
    std::string mirror;
    ActivationMechanism mechanism = ActivationMechanism::Symlink;
};

/// /usr/local/llvm, or <exe dir>/../versions on Windows
std::string default_versions_root();

/// /usr/local/bin, or <versions root>/../bin on Windows
std::string default_bin_dir(const std::string& versions_root);

/**
 * Resolve settings. For each value the priority is:
 *   1. command-line option
 *   2. LLVM_SELECT_ROOT / _BIN_DIR / _WORK_DIR / _MIRROR / _MECHANISM
 *   3. platform default
 * INVALID_ARGUMENT for an unknown mechanism or source location.
 */
Result<Settings> resolve_settings(const GlobalOptions& opts);

} // namespace llvmsel
