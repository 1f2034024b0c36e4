#include "llvmsel/install_receipt.hpp"

#include <nlohmann/json.hpp>

namespace llvmsel {

namespace {

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

} // namespace

std::string serialize_install_receipt(const InstallReceipt& receipt) {
    nlohmann::json j;
    j["$schema"] = kInstallReceiptSchema;
    j["version"] = receipt.version;
    j["build_type"] = build_type_to_string(receipt.build_type);
    j["installed_at"] = receipt.installed_at;
    j["source"] = receipt.source;
    return j.dump(2) + "\n";
}

InstallReceiptParseResult parse_install_receipt(const std::string& json_str) {
    InstallReceiptParseResult result;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        auto schema = get_string(j, "$schema");
        if (!schema || *schema != kInstallReceiptSchema) {
            result.error = std::string("$schema mismatch: expected ") + kInstallReceiptSchema;
            return result;
        }

        auto version = get_string(j, "version");
        if (!version || version->empty()) {
            result.error = "version missing";
            return result;
        }
        result.receipt.version = *version;

        auto build_type_str = get_string(j, "build_type");
        auto build_type = build_type_str ? parse_build_type(*build_type_str) : std::nullopt;
        if (!build_type) {
            result.error = "build_type missing or invalid";
            return result;
        }
        result.receipt.build_type = *build_type;

        if (auto installed_at = get_string(j, "installed_at")) {
            result.receipt.installed_at = *installed_at;
        }
        if (auto source = get_string(j, "source")) {
            result.receipt.source = *source;
        }
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
        return result;
    }

    result.ok = true;
    return result;
}

AtomicWriteResult write_install_receipt(const std::string& install_root,
                                        const InstallReceipt& receipt) {
    return atomic_write_file(join_path(install_root, kInstallReceiptFilename),
                             serialize_install_receipt(receipt));
}

std::optional<InstallReceipt> read_install_receipt(const std::string& install_root) {
    auto content = read_file(join_path(install_root, kInstallReceiptFilename));
    if (!content) {
        return std::nullopt;
    }

    auto parsed = parse_install_receipt(*content);
    if (!parsed.ok) {
        return std::nullopt;
    }
    return parsed.receipt;
}

} // namespace llvmsel
