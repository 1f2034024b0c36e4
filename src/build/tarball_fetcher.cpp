#include "llvmsel/toolchain.hpp"
#include "llvmsel/download.hpp"
#include "llvmsel/platform.hpp"
#include "llvmsel/process.hpp"
#include "llvmsel/release.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace llvmsel {

namespace fs = std::filesystem;

namespace {

Result<std::string> fetch_error(const std::string& message) {
    return Result<std::string>::err(Error(ErrorCode::FETCH_FAILURE, message));
}

// Where each component lands inside llvm-src
std::string component_destination(const std::string& component) {
    if (component == "clang") return "tools/clang";
    if (component == "compiler-rt") return "projects/compiler-rt";
    if (component == "libcxx") return "projects/libcxx";
    return "";
}

} // namespace

Result<std::string> ReleaseTarballFetcher::fetch(const FetchRequest& request) {
    auto release = LlvmRelease::parse(request.version);
    if (!release) {
        return fetch_error("unsupported LLVM version \"" + request.version + "\"");
    }

    auto location = parse_source_location(request.source_location);
    if (location.type == LocationType::Invalid) {
        return fetch_error(location.error);
    }

    if (!command_available("tar")) {
        return fetch_error("tar is required for the build process. "
                           "Please ensure tar is installed and available in the system PATH.");
    }

    ChecksumManifest checksums;
    if (!request.checksums_file.empty()) {
        auto content = read_file(request.checksums_file);
        if (!content) {
            return fetch_error("failed to read checksum file " + request.checksums_file);
        }
        checksums = parse_checksum_manifest(*content);
        if (!checksums.ok) {
            return fetch_error(request.checksums_file + ": " + checksums.error);
        }
    }

    for (const auto& tarball : release->tarballs()) {
        std::string archive = join_path(request.scratch_dir, tarball.filename);
        FetchResult fetched;
        if (location.type == LocationType::Http) {
            std::string url = LlvmRelease::tarballUrl(location.base, tarball);
            spdlog::info("Downloading {}", url);
            fetched = download_to_file(url, archive);
        } else {
            std::string path = join_path(join_path(location.base, tarball.version), tarball.filename);
            spdlog::info("Copying {}", path);
            fetched = copy_local_file(path, archive);
        }
        if (!fetched.ok) {
            return fetch_error("failed to fetch " + tarball.filename + ": " + fetched.error);
        }
        spdlog::debug("Fetched {} ({} bytes, sha256 {})", tarball.filename, fetched.bytes,
                      fetched.sha256);

        if (!request.checksums_file.empty()) {
            auto expected = checksums.digests.find(tarball.filename);
            if (expected == checksums.digests.end()) {
                return fetch_error("no checksum listed for " + tarball.filename);
            }
            if (fetched.sha256 != expected->second) {
                return fetch_error("SHA-256 mismatch for " + tarball.filename + ": expected " +
                                   expected->second + ", got " + fetched.sha256);
            }
        }

        std::string extract_dir = join_path(request.scratch_dir, tarball.component + "-src");
        std::error_code ec;
        fs::create_directories(extract_dir, ec);
        if (ec) {
            return fetch_error("failed to create " + extract_dir + ": " + ec.message());
        }

        ProcessSpec tar;
        tar.argv = {"tar", "-xf", archive, "-C", extract_dir, "--strip-components=1"};
        tar.quiet = true;
        auto extracted = run_process(tar);
        if (!extracted.ok) {
            return fetch_error("failed to run tar: " + extracted.error);
        }
        if (extracted.exit_code != 0) {
            return fetch_error("failed to extract " + tarball.filename + " (tar exited with code " +
                               std::to_string(extracted.exit_code) + ")");
        }

        if (!fs::remove(archive, ec) || ec) {
            spdlog::warn("Failed to remove {}: {}", archive, ec ? ec.message() : "not found");
        }
    }

    std::string llvm_src = join_path(request.scratch_dir, "llvm-src");
    for (const auto& tarball : release->tarballs()) {
        std::string target = component_destination(tarball.component);
        if (target.empty()) continue;

        fs::path from = fs::path(request.scratch_dir) / (tarball.component + "-src");
        fs::path to = fs::path(llvm_src) / target;
        std::error_code ec;
        fs::create_directories(to.parent_path(), ec);
        fs::rename(from, to, ec);
        if (ec) {
            return fetch_error("failed to move " + tarball.component + " sources into place: " +
                               ec.message());
        }
    }

    if (!is_regular_file(join_path(llvm_src, "CMakeLists.txt"))) {
        return fetch_error("extracted sources have no CMakeLists.txt in " + llvm_src);
    }

    return Result<std::string>::ok(llvm_src);
}

} // namespace llvmsel
