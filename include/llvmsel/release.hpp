#pragma once

/**
 * @file release.hpp
 * @brief Source release details for LLVM/Clang versions
 *
 * Accepted versions are MAJOR.MINOR up to 3.4 and MAJOR.MINOR.REVISION from
 * 3.4.1 on, with 2.6 (the first release with a clang tarball) as the minimum.
 */

#include "llvmsel/platform.hpp"

#include <optional>
#include <string>
#include <vector>

namespace llvmsel {

// One source tarball of a release
struct ReleaseTarball {
    std::string component;  // llvm, clang, compiler-rt, libcxx
    std::string filename;   // e.g. "cfe-9.0.0.src.tar.xz"
    std::string version;    // Version directory on the mirror
};

class LlvmRelease {
public:
    /// Parse and validate a version string; nullopt if unsupported
    static std::optional<LlvmRelease> parse(const std::string& version,
                                            Platform platform = get_current_platform());

    int major() const { return major_; }
    int minor() const { return minor_; }
    std::optional<int> revision() const { return revision_; }

    /// "3.4", "3.4.1", "9.0.0"
    std::string toString() const;

    /// Archive suffix shared by all tarballs of this release
    std::string extension() const;

    /// Source tarballs to fetch; llvm first, then clang, then optional runtimes
    std::vector<ReleaseTarball> tarballs() const;

    /// <mirror>/<tarball version>/<filename>
    static std::string tarballUrl(const std::string& mirror, const ReleaseTarball& tarball);

private:
    LlvmRelease(int major, int minor, std::optional<int> revision, Platform platform)
        : major_(major), minor_(minor), revision_(revision), platform_(platform) {}

    std::string tarballVersion(const std::string& component) const;

    int major_;
    int minor_;
    std::optional<int> revision_;
    Platform platform_;
};

} // namespace llvmsel
