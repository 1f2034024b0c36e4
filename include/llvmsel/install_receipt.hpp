#pragma once

#include "llvmsel/platform.hpp"
#include "llvmsel/version_key.hpp"

#include <optional>
#include <string>

namespace llvmsel {

// ============================================================================
// Install Receipt
// ============================================================================
//
// Written to <install root>/llvm-select.json after a successful build.
// Audit only: validity and listing never depend on it.

constexpr const char* kInstallReceiptFilename = "llvm-select.json";
constexpr const char* kInstallReceiptSchema = "llvm-select.install.v1";

struct InstallReceipt {
    std::string version;
    BuildType build_type = BuildType::Release;
    std::string installed_at;  // RFC3339 timestamp
    std::string source;        // Mirror URL or file: location
};

struct InstallReceiptParseResult {
    bool ok = false;
    std::string error;
    InstallReceipt receipt;
};

std::string serialize_install_receipt(const InstallReceipt& receipt);

InstallReceiptParseResult parse_install_receipt(const std::string& json_str);

AtomicWriteResult write_install_receipt(const std::string& install_root,
                                        const InstallReceipt& receipt);

/// nullopt if the receipt is missing or unreadable
std::optional<InstallReceipt> read_install_receipt(const std::string& install_root);

} // namespace llvmsel
