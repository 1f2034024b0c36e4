#include "llvmsel/toolchain.hpp"
#include "llvmsel/platform.hpp"
#include "llvmsel/process.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace llvmsel {

std::string CMakeToolchain::selectGenerator() {
    bool windows = get_current_platform() == Platform::Windows;
    if (!windows && command_available("ninja")) {
        return "Ninja";
    }
    if (windows && !command_available("g++", "-v")) {
        return "NMake Makefiles";
    }
    return "Unix Makefiles";
}

std::vector<std::string> CMakeToolchain::configureArguments(const std::string& generator,
                                                            BuildType build_type,
                                                            const std::string& destination) {
    return {
        "cmake",
        "-DCMAKE_INSTALL_PREFIX=" + destination,
        std::string("-DCMAKE_BUILD_TYPE=") + build_type_to_string(build_type),
        "-DLLVM_ENABLE_EH=true",
        "-DLLVM_ENABLE_RTTI=true",
        "-DLLVM_INCLUDE_TESTS=false",
        "-G", generator,
        "..",
    };
}

Result<void> CMakeToolchain::runStep(const std::string& step, const std::vector<std::string>& argv,
                                     const std::string& cwd) const {
    ProcessSpec spec;
    spec.argv = argv;
    spec.cwd = cwd;
    spec.quiet = !show_output_;

    spdlog::debug("{}: {}", step, format_command(argv));
    auto result = run_process(spec);
    if (!result.ok) {
        return Result<void>::err(Error(ErrorCode::BUILD_FAILURE,
                                       step + ": failed to run " + argv.front() + ": " + result.error));
    }
    if (result.exit_code != 0) {
        return Result<void>::err(Error(ErrorCode::BUILD_FAILURE,
                                       "Command " + format_command(argv) + " failed with exit code " +
                                       std::to_string(result.exit_code)));
    }
    return Result<void>::ok();
}

Result<void> CMakeToolchain::build(const std::string& source_tree, BuildType build_type,
                                   const std::string& destination) {
    if (!command_available("cmake")) {
        return Result<void>::err(Error(ErrorCode::BUILD_FAILURE,
                                       "cmake is required for the build process. "
                                       "Please ensure cmake is installed and available in the system PATH."));
    }

    std::string build_dir = join_path(source_tree, "build");
    std::error_code ec;
    std::filesystem::create_directories(build_dir, ec);
    if (ec) {
        return Result<void>::err(Error(ErrorCode::BUILD_FAILURE,
                                       "failed to create " + build_dir + ": " + ec.message()));
    }

    std::string generator = selectGenerator();
    spdlog::info("Configuring with the {} generator", generator);

    auto configured = runStep("configure", configureArguments(generator, build_type, destination),
                              build_dir);
    if (configured.isErr()) return configured;

    auto compiled = runStep("build", {"cmake", "--build", "."}, build_dir);
    if (compiled.isErr()) return compiled;

    return runStep("install", {"cmake", "--build", ".", "--target", "install"}, build_dir);
}

} // namespace llvmsel
