#include "llvmsel/version_key.hpp"

#include <tuple>

namespace llvmsel {

const char* build_type_to_string(BuildType type) {
    switch (type) {
        case BuildType::Release: return "Release";
        case BuildType::Debug: return "Debug";
        case BuildType::RelWithDebInfo: return "RelWithDebInfo";
        case BuildType::MinSizeRel: return "MinSizeRel";
    }
    return "Release";
}

std::optional<BuildType> parse_build_type(const std::string& token) {
    if (token == "Release") return BuildType::Release;
    if (token == "Debug") return BuildType::Debug;
    if (token == "RelWithDebInfo") return BuildType::RelWithDebInfo;
    if (token == "MinSizeRel") return BuildType::MinSizeRel;
    return std::nullopt;
}

const std::vector<BuildType>& all_build_types() {
    static const std::vector<BuildType> types = {
        BuildType::Release,
        BuildType::Debug,
        BuildType::RelWithDebInfo,
        BuildType::MinSizeRel,
    };
    return types;
}

std::string build_type_list() {
    std::string list;
    for (auto type : all_build_types()) {
        if (!list.empty()) list += ", ";
        list += build_type_to_string(type);
    }
    return list;
}

std::string VersionKey::dir_name() const {
    return version + "-" + build_type_to_string(build_type);
}

bool VersionKey::operator<(const VersionKey& other) const {
    return std::tie(version, build_type) < std::tie(other.version, other.build_type);
}

std::optional<VersionKey> parse_dir_name(const std::string& name) {
    auto dash = name.rfind('-');
    if (dash == std::string::npos || dash == 0) {
        return std::nullopt;
    }

    auto build_type = parse_build_type(name.substr(dash + 1));
    if (!build_type) {
        return std::nullopt;
    }

    VersionKey key;
    key.version = name.substr(0, dash);
    key.build_type = *build_type;
    return key;
}

} // namespace llvmsel
