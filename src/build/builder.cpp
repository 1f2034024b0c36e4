#include "llvmsel/builder.hpp"
#include "llvmsel/install_receipt.hpp"
#include "llvmsel/platform.hpp"

#include <spdlog/spdlog.h>

namespace llvmsel {

std::string Builder::scratchDirectory(const BuildRequest& request) {
    return join_path(absolute_path(request.work_dir.empty() ? "." : request.work_dir),
                     "llvm-select-" + request.key.dir_name());
}

Result<InstalledVersion> Builder::install(const BuildRequest& request) {
    const VersionKey& key = request.key;

    if (store_.exists(key)) {
        return Result<InstalledVersion>::err(Error(
            ErrorCode::ALREADY_INSTALLED,
            "version already installed: " + key.dir_name() + " (remove it first to reinstall)"));
    }

    // Anything here without a valid layout is debris from an interrupted build
    std::string destination = store_.resolvePath(key);
    std::error_code ec;
    if (path_exists(destination)) {
        spdlog::warn("Removing incomplete installation at {}", destination);
        if (!remove_directory(destination, ec)) {
            return Result<InstalledVersion>::err(filesystem_error(
                ec, "failed to remove incomplete installation " + destination + ": " + ec.message()));
        }
    }

    std::string scratch = scratchDirectory(request);
    if (path_exists(scratch) && !remove_directory(scratch, ec)) {
        return Result<InstalledVersion>::err(filesystem_error(
            ec, "failed to clear build directory " + scratch + ": " + ec.message()));
    }
    auto created = atomic_create_directory(scratch);
    if (!created.ok) {
        return Result<InstalledVersion>::err(filesystem_error(created.code, created.error));
    }

    auto result = runSteps(request, scratch);

    if (request.keep_sources) {
        spdlog::info("Build files kept in {}", scratch);
    } else if (!remove_directory(scratch, ec)) {
        spdlog::warn("Failed to remove build directory {}: {}", scratch, ec.message());
    }

    return result;
}

Result<InstalledVersion> Builder::runSteps(const BuildRequest& request, const std::string& scratch) {
    const VersionKey& key = request.key;
    std::string destination = store_.resolvePath(key);

    FetchRequest fetch_request;
    fetch_request.version = key.version;
    fetch_request.scratch_dir = scratch;
    fetch_request.source_location = request.source_location;
    fetch_request.checksums_file = request.checksums_file;

    spdlog::info("Fetching sources for LLVM {}", key.version);
    auto source_tree = fetcher_.fetch(fetch_request);
    if (source_tree.isErr()) {
        return Result<InstalledVersion>::err(
            Error(ErrorCode::FETCH_FAILURE, source_tree.error().message()));
    }

    auto root_created = atomic_create_directory(store_.root());
    if (!root_created.ok) {
        return Result<InstalledVersion>::err(filesystem_error(root_created.code, root_created.error));
    }

    spdlog::info("Building {} from {}", key.dir_name(), source_tree.value());
    auto built = toolchain_.build(source_tree.value(), key.build_type, destination);
    if (built.isErr()) {
        Error error(ErrorCode::BUILD_FAILURE, built.error().message());
        discardDestination(destination, error);
        return Result<InstalledVersion>::err(error);
    }

    if (!InstallationStore::hasValidLayout(destination)) {
        Error error(ErrorCode::BUILD_FAILURE,
                    "build reported success but " + destination + " has no bin/" +
                    query_executable_name());
        discardDestination(destination, error);
        return Result<InstalledVersion>::err(error);
    }

    InstallReceipt receipt;
    receipt.version = key.version;
    receipt.build_type = key.build_type;
    receipt.installed_at = get_current_timestamp();
    receipt.source = request.source_location;
    auto written = write_install_receipt(destination, receipt);
    if (!written.ok) {
        spdlog::warn("Failed to write install receipt in {}: {}", destination, written.error);
    }

    InstalledVersion installed;
    installed.key = key;
    installed.root = destination;
    return Result<InstalledVersion>::ok(installed);
}

void Builder::discardDestination(const std::string& destination, Error& error) {
    if (!path_exists(destination)) {
        return;
    }

    std::error_code ec;
    if (!remove_directory(destination, ec)) {
        spdlog::error("Failed to clean up {}: {}", destination, ec.message());
        error.withContext("cleanup of " + destination + " failed (" + ec.message() + ")");
    }
}

} // namespace llvmsel
