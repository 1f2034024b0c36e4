/**
 * @file fakes.hpp
 * @brief In-process stand-ins for the fetch and build collaborators
 */

#pragma once

#include <llvmsel/builder.hpp>
#include <llvmsel/platform.hpp>

#include "test_helpers.hpp"

namespace llvmsel::test {

// Writes a marker source tree into the scratch directory
class FakeFetcher : public SourceFetcher {
public:
    Result<std::string> fetch(const FetchRequest& request) override {
        calls++;
        last_request = request;
        if (fail) {
            return Result<std::string>::err(Error(ErrorCode::IO_ERROR, "mirror unreachable"));
        }
        std::string tree = join_path(request.scratch_dir, "llvm-src");
        write_text_file(join_path(tree, "CMakeLists.txt"), "project(LLVM)\n");
        return Result<std::string>::ok(tree);
    }

    int calls = 0;
    bool fail = false;
    FetchRequest last_request;
};

class FakeToolchain : public BuildToolchain {
public:
    enum class Mode {
        Succeed,          // installs bin/llvm-config
        Fail,             // writes partial output, then fails
        NoQueryExecutable // "succeeds" without bin/llvm-config
    };

    Result<void> build(const std::string& source_tree, BuildType build_type,
                       const std::string& destination) override {
        calls++;
        last_source_tree = source_tree;
        last_build_type = build_type;

        write_text_file(join_path(destination, "lib/libLLVMCore.a"), "partial");
        switch (mode) {
            case Mode::Succeed:
                make_fake_llvm_config(destination, reportedVersion(destination));
                return Result<void>::ok();
            case Mode::Fail:
                return Result<void>::err(Error(ErrorCode::BUILD_FAILURE,
                                               "Command make failed with exit code 2"));
            case Mode::NoQueryExecutable:
                std::filesystem::create_directories(join_path(destination, "bin"));
                return Result<void>::ok();
        }
        return Result<void>::ok();
    }

    // Empty: the version part of the destination's directory name
    std::string reportedVersion(const std::string& destination) const {
        if (!reported_version.empty()) return reported_version;
        auto key = parse_dir_name(get_filename(destination));
        return key ? key->version : "unknown";
    }

    Mode mode = Mode::Succeed;
    std::string reported_version;
    int calls = 0;
    std::string last_source_tree;
    BuildType last_build_type = BuildType::Release;
};

} // namespace llvmsel::test
