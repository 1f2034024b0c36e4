#include "llvmsel/activator.hpp"
#include "llvmsel/platform.hpp"

#include <spdlog/spdlog.h>

namespace llvmsel {

ShimActivator::ShimActivator(const InstallationStore& store, const std::string& bin_dir,
                             ShimStyle style)
    : Activator(store, absolute_path(bin_dir)), style_(style) {}

std::string ShimActivator::linkPath() const {
    if (style_ == ShimStyle::Batch) {
        return join_path(bin_dir_, "llvm-config.cmd");
    }
    return join_path(bin_dir_, "llvm-config");
}

namespace {

// cmd.exe expands these even inside double quotes
constexpr const char* kBatchUnsafeChars = "\"%!^";

std::string single_quote(const std::string& word) {
    std::string quoted = "'";
    for (char c : word) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
}

// Reads one word made of '...' runs and \' escapes, as single_quote writes it
std::optional<std::string> read_single_quoted(const std::string& text, size_t pos) {
    if (pos >= text.size() || text[pos] != '\'') {
        return std::nullopt;
    }

    std::string word;
    while (pos < text.size() && text[pos] != ' ' && text[pos] != '\n') {
        if (text[pos] == '\'') {
            auto close = text.find('\'', pos + 1);
            if (close == std::string::npos) {
                return std::nullopt;
            }
            word += text.substr(pos + 1, close - pos - 1);
            pos = close + 1;
        } else if (text[pos] == '\\' && pos + 1 < text.size() && text[pos + 1] == '\'') {
            word += '\'';
            pos += 2;
        } else {
            return std::nullopt;
        }
    }

    if (word.empty()) {
        return std::nullopt;
    }
    return word;
}

std::optional<std::string> first_double_quoted(const std::string& text) {
    auto open = text.find('"');
    if (open == std::string::npos) {
        return std::nullopt;
    }
    auto close = text.find('"', open + 1);
    if (close == std::string::npos || close == open + 1) {
        return std::nullopt;
    }
    return text.substr(open + 1, close - open - 1);
}

} // namespace

std::string ShimActivator::renderShim(ShimStyle style, const std::string& executable) {
    if (style == ShimStyle::Batch) {
        return "@echo off\r\n\"" + executable + "\" %*\r\n";
    }
    // exec keeps the pid, so the exit status passes straight through
    return "#!/bin/sh\nexec " + single_quote(executable) + " \"$@\"\n";
}

std::optional<std::string> ShimActivator::parseShimTarget(const std::string& script) {
    const std::string exec_prefix = "exec ";
    size_t line = 0;
    while (line < script.size()) {
        if (script.compare(line, exec_prefix.size(), exec_prefix) == 0) {
            return read_single_quoted(script, line + exec_prefix.size());
        }
        auto next = script.find('\n', line);
        if (next == std::string::npos) {
            break;
        }
        line = next + 1;
    }
    return first_double_quoted(script);
}

Result<void> ShimActivator::activate(const VersionKey& key) {
    auto ready = prepare(key);
    if (ready.isErr()) {
        return ready;
    }

    std::string target = store_.queryExecutablePath(key);
    if (style_ == ShimStyle::Batch && target.find_first_of(kBatchUnsafeChars) != std::string::npos) {
        return Result<void>::err(Error(ErrorCode::INVALID_ARGUMENT,
                                       "cannot generate a batch shim for a path containing any of " +
                                       std::string(kBatchUnsafeChars) + ": " + target));
    }

    std::string shim = linkPath();
    auto result = atomic_write_file(shim, renderShim(style_, target), 0755);
    if (!result.ok) {
        return Result<void>::err(filesystem_error(
            result.code, "failed to write " + shim + ": " + result.error));
    }

    spdlog::info("Set {} to call {}", shim, target);
    return Result<void>::ok();
}

ActiveStatus ShimActivator::currentActive() const {
    std::string shim = linkPath();

    auto content = read_file(shim);
    if (!content) {
        return ActiveStatus{};
    }

    auto target = parseShimTarget(*content);
    if (!target) {
        ActiveStatus status;
        status.state = ActiveState::Unrecognized;
        status.target = shim;
        return status;
    }

    return classifyTarget(*target);
}

} // namespace llvmsel
