#pragma once

#include "llvmsel/dispatcher.hpp"
#include "llvmsel/settings.hpp"

#include <ostream>

namespace llvmsel {

/**
 * Result of parsing argv.
 *
 * exit_now is set when parsing already produced the final outcome: help or
 * version output (exit_code 0) or a usage error (exit_code 2).
 */
struct CommandLine {
    bool exit_now = false;
    int exit_code = 0;
    GlobalOptions options;
    Command command;
};

/**
 * Parse the llvm-select command line.
 *
 *   llvm-select VERSION [BUILDTYPE]            activate
 *   llvm-select install VERSION [BUILDTYPE]    build and install
 *   llvm-select --install VERSION [BUILDTYPE]  same as install
 *   llvm-select --remove VERSION [BUILDTYPE]   remove
 *   llvm-select --list | --current
 */
CommandLine parse_command_line(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

} // namespace llvmsel
