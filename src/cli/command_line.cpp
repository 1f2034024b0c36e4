#include "llvmsel/command_line.hpp"
#include "llvmsel/version_key.hpp"

#include <CLI/CLI.hpp>

namespace llvmsel {

namespace {

void add_version_arguments(CLI::App* app, Command& command) {
    app->add_option("VERSION", command.version, "LLVM version");
    app->add_option("BUILDTYPE", command.build_type,
                    "Build type (" + build_type_list() + ")");
}

} // namespace

CommandLine parse_command_line(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
    CommandLine result;
    GlobalOptions& opts = result.options;
    Command& command = result.command;

    CLI::App app{"llvm-select - manage side-by-side LLVM installations"};
    app.set_version_flag("-V,--version", LLVMSEL_VERSION);
    app.require_subcommand(0, 1);

    // Global options
    app.add_option("--root", opts.root, "Versions root directory");
    app.add_option("--bin-dir", opts.bin_dir, "Directory holding the active llvm-config");
    app.add_option("--work-dir", opts.work_dir, "Scratch directory for source downloads and builds");
    app.add_option("--mirror", opts.mirror, "Release mirror (https://, http:// or file:)");
    app.add_option("--mechanism", opts.mechanism, "Activation mechanism (symlink or shim)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Install options
    app.add_option("--checksums", command.checksums_file, "sha256sum-style manifest for source tarballs");
    app.add_flag("--no-cleanup", command.keep_sources,
                 "Don't remove build files after installing a new library version");

    // Actions
    bool list = false;
    bool current = false;
    bool remove = false;
    bool install = false;
    auto* list_flag = app.add_flag("--list", list, "List installed library versions");
    auto* current_flag = app.add_flag("--current", current, "Print the active library version");
    auto* remove_flag = app.add_flag("--remove", remove, "Remove an installed library version");
    auto* install_flag = app.add_flag("--install", install, "Install a new library version");
    list_flag->excludes(current_flag)->excludes(remove_flag)->excludes(install_flag);
    current_flag->excludes(remove_flag)->excludes(install_flag);
    remove_flag->excludes(install_flag);

    add_version_arguments(&app, command);

    auto* install_cmd = app.add_subcommand("install", "Build and install a new library version");
    install_cmd->fallthrough();
    add_version_arguments(install_cmd, command);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e, out, err);
        result.exit_now = true;
        result.exit_code = code == 0 ? 0 : static_cast<int>(ExitCode::InvalidArgument);
        return result;
    }

    if (list) {
        command.action = Action::List;
    } else if (current) {
        command.action = Action::Current;
    } else if (remove) {
        command.action = Action::Remove;
    } else if (install || install_cmd->parsed()) {
        command.action = Action::Install;
    } else {
        command.action = Action::Activate;
    }

    if (install_cmd->parsed() && (list || current || remove)) {
        err << "Error: install cannot be combined with --list, --current or --remove" << std::endl;
        result.exit_now = true;
        result.exit_code = static_cast<int>(ExitCode::InvalidArgument);
    }

    return result;
}

} // namespace llvmsel
