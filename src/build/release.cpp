#include "llvmsel/release.hpp"

#include <cctype>
#include <sstream>

namespace llvmsel {

namespace {

// Split on '.', requiring every component to be a non-empty run of digits
std::optional<std::vector<int>> parse_components(const std::string& s) {
    std::vector<int> parts;
    std::string current;
    std::istringstream ss(s);

    if (s.empty() || s.back() == '.') {
        return std::nullopt;
    }

    while (std::getline(ss, current, '.')) {
        if (current.empty() || current.size() > 6) {
            return std::nullopt;
        }
        for (char c : current) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
        }
        parts.push_back(std::stoi(current));
    }

    return parts;
}

} // namespace

std::optional<LlvmRelease> LlvmRelease::parse(const std::string& version, Platform platform) {
    auto parts = parse_components(version);
    if (!parts || parts->size() < 2 || parts->size() > 3) {
        return std::nullopt;
    }

    int major = (*parts)[0];
    int minor = (*parts)[1];

    // 2.6 first shipped a clang source tarball
    if (major < 2 || (major == 2 && minor < 6)) {
        return std::nullopt;
    }

    // 3.4.1 is the first release with a revision number
    if (parts->size() == 3 && (major < 3 || (major == 3 && minor < 4))) {
        return std::nullopt;
    }

    // Everything after 3.4 requires one
    if (parts->size() == 2 && (major > 3 || (major == 3 && minor > 4))) {
        return std::nullopt;
    }

    std::optional<int> revision;
    if (parts->size() == 3) {
        revision = (*parts)[2];
    }

    return LlvmRelease(major, minor, revision, platform);
}

std::string LlvmRelease::toString() const {
    std::string s = std::to_string(major_) + "." + std::to_string(minor_);
    if (revision_) {
        s += "." + std::to_string(*revision_);
    }
    return s;
}

std::string LlvmRelease::extension() const {
    if (major_ == 2 && minor_ > 6) return ".tgz";
    if ((major_ == 2 && minor_ == 6) || (major_ == 3 && minor_ == 0)) return ".tar.gz";
    if (major_ == 3 && minor_ < 5) return ".src.tar.gz";
    return ".src.tar.xz";
}

std::string LlvmRelease::tarballVersion(const std::string& component) const {
    // 3.4.1 and 3.4.2 reuse the 3.4 compiler-rt and libcxx tarballs
    if ((component == "compiler-rt" || component == "libcxx") && major_ == 3 && minor_ == 4) {
        return "3.4";
    }
    return toString();
}

std::vector<ReleaseTarball> LlvmRelease::tarballs() const {
    std::vector<ReleaseTarball> result;

    auto add = [&](const std::string& component, const std::string& prefix) {
        ReleaseTarball tarball;
        tarball.component = component;
        tarball.version = tarballVersion(component);
        tarball.filename = prefix + "-" + tarball.version + extension();
        result.push_back(std::move(tarball));
    };

    add("llvm", "llvm");

    // "clang" up to 3.2 and for plain 3.4, "cfe" for 3.3 and 3.4.1 onwards
    bool named_clang = major_ < 3 ||
                       (major_ == 3 && (minor_ < 3 || (minor_ == 4 && !revision_)));
    add("clang", named_clang ? "clang" : "cfe");

    bool at_least_3_1 = major_ > 3 || (major_ == 3 && minor_ >= 1);
    if (platform_ != Platform::Windows && at_least_3_1) {
        add("compiler-rt", "compiler-rt");
    }

    bool at_least_3_3 = major_ > 3 || (major_ == 3 && minor_ >= 3);
    if (platform_ == Platform::macOS && at_least_3_3) {
        add("libcxx", "libcxx");
    }

    return result;
}

std::string LlvmRelease::tarballUrl(const std::string& mirror, const ReleaseTarball& tarball) {
    std::string base = mirror;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/" + tarball.version + "/" + tarball.filename;
}

} // namespace llvmsel
