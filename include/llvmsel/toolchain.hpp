#pragma once

/**
 * @file toolchain.hpp
 * @brief Default collaborators: release tarball fetching and CMake builds
 */

#include "llvmsel/builder.hpp"

#include <string>
#include <vector>

namespace llvmsel {

constexpr const char* kDefaultMirror = "https://releases.llvm.org";

/**
 * Downloads (or copies from a file: mirror) the source tarballs of a release,
 * verifies them against an optional checksum manifest, extracts them with the
 * system tar and assembles the tree:
 *
 *   scratch/llvm-src/                      llvm
 *   scratch/llvm-src/tools/clang/          clang / cfe
 *   scratch/llvm-src/projects/compiler-rt/
 *   scratch/llvm-src/projects/libcxx/
 */
class ReleaseTarballFetcher : public SourceFetcher {
public:
    Result<std::string> fetch(const FetchRequest& request) override;
};

/**
 * Configures with CMake in <source>/build, then builds and installs into the
 * destination prefix.
 */
class CMakeToolchain : public BuildToolchain {
public:
    explicit CMakeToolchain(bool show_output = true) : show_output_(show_output) {}

    Result<void> build(const std::string& source_tree, BuildType build_type,
                       const std::string& destination) override;

    /// CMake generator for this machine: Ninja when available
    static std::string selectGenerator();

    /// Arguments of the configure step
    static std::vector<std::string> configureArguments(const std::string& generator,
                                                       BuildType build_type,
                                                       const std::string& destination);

private:
    Result<void> runStep(const std::string& step, const std::vector<std::string>& argv,
                         const std::string& cwd) const;

    bool show_output_;
};

} // namespace llvmsel
