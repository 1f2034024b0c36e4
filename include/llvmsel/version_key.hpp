#pragma once

#include <optional>
#include <string>
#include <vector>

namespace llvmsel {

// ============================================================================
// Build Types
// ============================================================================

// The CMake build types an installation can be built with
enum class BuildType {
    Release,
    Debug,
    RelWithDebInfo,
    MinSizeRel
};

const char* build_type_to_string(BuildType type);

// Exact, case-sensitive match against the enumerator names
std::optional<BuildType> parse_build_type(const std::string& token);

// All build types, in declaration order
const std::vector<BuildType>& all_build_types();

// "Release, Debug, RelWithDebInfo, MinSizeRel"
std::string build_type_list();

// ============================================================================
// Version Key
// ============================================================================

// Identifies one installation. Versions compare as plain strings.
struct VersionKey {
    std::string version;
    BuildType build_type = BuildType::Release;

    // "{version}-{buildType}", the installation's directory name
    std::string dir_name() const;

    bool operator==(const VersionKey& other) const {
        return version == other.version && build_type == other.build_type;
    }
    bool operator!=(const VersionKey& other) const { return !(*this == other); }
    bool operator<(const VersionKey& other) const;
};

// Parse a "VERSION-BUILDTYPE" directory name, splitting at the last '-'
std::optional<VersionKey> parse_dir_name(const std::string& name);

// ============================================================================
// Installed Version
// ============================================================================

struct InstalledVersion {
    VersionKey key;
    std::string root;  // Absolute installation root
};

} // namespace llvmsel
