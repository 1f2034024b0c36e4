#pragma once

/**
 * @file builder.hpp
 * @brief Fetch, build and install a new version into the InstallationStore
 *
 * Fetching sources and running the native build are external collaborators
 * behind SourceFetcher and BuildToolchain. The Builder only sequences them,
 * enforces the store's layout invariant and cleans up after failures.
 */

#include "llvmsel/error.hpp"
#include "llvmsel/installation_store.hpp"
#include "llvmsel/version_key.hpp"

#include <string>

namespace llvmsel {

// ============================================================================
// Requests
// ============================================================================

struct BuildRequest {
    VersionKey key;
    std::string source_location;  // Mirror URL or file:<dir>
    std::string work_dir;         // Parent of the per-request scratch directory
    std::string checksums_file;   // Optional sha256sum manifest
    bool keep_sources = false;    // Leave the scratch directory behind
};

struct FetchRequest {
    std::string version;
    std::string scratch_dir;      // Exists and is empty when fetch() is called
    std::string source_location;
    std::string checksums_file;
};

// ============================================================================
// External collaborators
// ============================================================================

class SourceFetcher {
public:
    virtual ~SourceFetcher() = default;

    /// Produce a source tree under request.scratch_dir and return its path
    virtual Result<std::string> fetch(const FetchRequest& request) = 0;
};

class BuildToolchain {
public:
    virtual ~BuildToolchain() = default;

    /// Configure, compile and install `source_tree` into `destination`
    virtual Result<void> build(const std::string& source_tree, BuildType build_type,
                               const std::string& destination) = 0;
};

// ============================================================================
// Builder
// ============================================================================

class Builder {
public:
    Builder(InstallationStore& store, SourceFetcher& fetcher, BuildToolchain& toolchain)
        : store_(store), fetcher_(fetcher), toolchain_(toolchain) {}

    /**
     * @brief Install request.key into the store
     *
     * ALREADY_INSTALLED if the key exists (nothing is touched),
     * FETCH_FAILURE / BUILD_FAILURE otherwise on failure. After any failure
     * the destination directory does not exist. Never touches the active link.
     */
    Result<InstalledVersion> install(const BuildRequest& request);

    /// Scratch directory used for a request
    static std::string scratchDirectory(const BuildRequest& request);

private:
    Result<InstalledVersion> runSteps(const BuildRequest& request, const std::string& scratch);
    void discardDestination(const std::string& destination, Error& error);

    InstallationStore& store_;
    SourceFetcher& fetcher_;
    BuildToolchain& toolchain_;
};

} // namespace llvmsel
