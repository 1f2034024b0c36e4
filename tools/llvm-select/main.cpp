/**
 * llvm-select CLI - Entry Point
 *
 * Installs, removes, lists and activates side-by-side LLVM builds.
 */

#include "llvmsel/command_line.hpp"
#include "llvmsel/dispatcher.hpp"
#include "llvmsel/toolchain.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>

namespace {

void setup_logging(const llvmsel::GlobalOptions& opts) {
    auto logger = spdlog::stderr_color_mt("llvm-select");
    logger->set_pattern("%^[%l]%$ %v");
    spdlog::set_default_logger(logger);

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

} // namespace

int main(int argc, char** argv) {
    using namespace llvmsel;

    auto cli = parse_command_line(argc, argv, std::cout, std::cerr);
    if (cli.exit_now) {
        return cli.exit_code;
    }

    setup_logging(cli.options);

    auto settings = resolve_settings(cli.options);
    if (settings.isErr()) {
        std::cerr << "Error: " << settings.error().message() << std::endl;
        return static_cast<int>(exit_code_for(settings.error().code()));
    }

    const Settings& resolved = settings.value();
    spdlog::debug("Versions root: {}", resolved.versions_root);
    spdlog::debug("Bin dir: {}", resolved.bin_dir);

    InstallationStore store(resolved.versions_root);
    auto activator = make_activator(resolved.mechanism, store, resolved.bin_dir);
    ReleaseTarballFetcher fetcher;
    CMakeToolchain toolchain(!cli.options.quiet && !cli.options.json);
    Builder builder(store, fetcher, toolchain);

    CommandDispatcher dispatcher(store, *activator, builder, resolved, cli.options.json,
                                 std::cout, std::cerr);
    return dispatcher.run(cli.command);
}
