#pragma once

/**
 * @file installation_store.hpp
 * @brief The on-disk directory of installed LLVM versions
 *
 * Layout:
 *   <root>/
 *     <version>-<buildType>/
 *       bin/llvm-config        (required; layout invariant)
 *       llvm-select.json       (install receipt, informational)
 */

#include "llvmsel/error.hpp"
#include "llvmsel/version_key.hpp"

#include <string>
#include <vector>

namespace llvmsel {

class InstallationStore {
public:
    /// @param root Versions root; made absolute on construction
    explicit InstallationStore(const std::string& root);

    const std::string& root() const { return root_; }

    /**
     * @brief List valid installations, ordered by directory name
     *
     * Entries whose name does not parse as VERSION-BUILDTYPE, or which fail
     * the layout invariant, are skipped. A missing root yields an empty list.
     */
    std::vector<InstalledVersion> list() const;

    /// root/"{version}-{buildType}"; does not touch the filesystem
    std::string resolvePath(const VersionKey& key) const;

    /// Path of the installation's query executable (bin/llvm-config)
    std::string queryExecutablePath(const VersionKey& key) const;

    /// True if the resolved path satisfies the layout invariant
    bool exists(const VersionKey& key) const;

    /// Recursively delete an installation. NOT_INSTALLED if !exists(key).
    Result<void> remove(const VersionKey& key);

    /// Layout invariant check for an arbitrary installation root
    static bool hasValidLayout(const std::string& install_root);

private:
    std::string root_;
};

} // namespace llvmsel
