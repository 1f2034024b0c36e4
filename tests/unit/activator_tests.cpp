#include <doctest/doctest.h>
#include <llvmsel/activator.hpp>
#include <llvmsel/installation_store.hpp>
#include <llvmsel/platform.hpp>

#include "test_helpers.hpp"

#include <atomic>
#include <thread>

#ifndef _WIN32
#include <unistd.h>
#endif

using namespace llvmsel;
using namespace llvmsel::test;

namespace {

// Versions root and bin dir side by side in one temp directory
struct ActivationFixture {
    TempTestDir temp{"llvmsel_activator"};
    InstallationStore store{temp.path("versions")};
    std::string bin_dir = temp.path("bin");

    std::vector<std::string> binEntries() const { return list_directory(bin_dir); }
};

} // namespace

// =============================================================================
// Parsing helpers
// =============================================================================

TEST_CASE("parse_activation_mechanism") {
    CHECK(parse_activation_mechanism("symlink") == ActivationMechanism::Symlink);
    CHECK(parse_activation_mechanism("shim") == ActivationMechanism::Shim);
    CHECK_FALSE(parse_activation_mechanism("copy").has_value());
    CHECK_FALSE(parse_activation_mechanism("Symlink").has_value());
}

TEST_CASE("active_state_to_string") {
    CHECK(std::string(active_state_to_string(ActiveState::None)) == "none");
    CHECK(std::string(active_state_to_string(ActiveState::Active)) == "active");
    CHECK(std::string(active_state_to_string(ActiveState::Dangling)) == "dangling");
    CHECK(std::string(active_state_to_string(ActiveState::Unrecognized)) == "unrecognized");
}

TEST_CASE("make_activator picks the variant for the mechanism") {
    ActivationFixture f;

    auto symlink = make_activator(ActivationMechanism::Symlink, f.store, f.bin_dir);
    REQUIRE(symlink != nullptr);
    CHECK(symlink->linkPath() == join_path(absolute_path(f.bin_dir), query_executable_name()));

    auto shim = make_activator(ActivationMechanism::Shim, f.store, f.bin_dir);
    REQUIRE(shim != nullptr);
    CHECK(get_filename(shim->linkPath()).rfind("llvm-config", 0) == 0);
}

// =============================================================================
// Shim scripts
// =============================================================================

TEST_CASE("ShimActivator renders and parses scripts") {
    SUBCASE("shell") {
        auto script = ShimActivator::renderShim(ShimStyle::Shell, "/opt/llvm/9.0.0-Release/bin/llvm-config");
        CHECK(script == "#!/bin/sh\nexec '/opt/llvm/9.0.0-Release/bin/llvm-config' \"$@\"\n");
        CHECK(ShimActivator::parseShimTarget(script) == "/opt/llvm/9.0.0-Release/bin/llvm-config");
    }

    SUBCASE("shell path with quotes and expansions") {
        std::string exe = "/opt/it's $HOME `id` \\n/9.0.0-Release/bin/llvm-config";
        auto script = ShimActivator::renderShim(ShimStyle::Shell, exe);
        CHECK(script == "#!/bin/sh\nexec '/opt/it'\\''s $HOME `id` \\n/9.0.0-Release/bin/llvm-config' \"$@\"\n");
        CHECK(ShimActivator::parseShimTarget(script) == exe);
    }

    SUBCASE("batch") {
        auto script = ShimActivator::renderShim(ShimStyle::Batch, "C:/llvm/versions/9.0.0-Release/bin/llvm-config.exe");
        CHECK(script == "@echo off\r\n\"C:/llvm/versions/9.0.0-Release/bin/llvm-config.exe\" %*\r\n");
        CHECK(ShimActivator::parseShimTarget(script) == "C:/llvm/versions/9.0.0-Release/bin/llvm-config.exe");
    }

    SUBCASE("foreign scripts") {
        CHECK_FALSE(ShimActivator::parseShimTarget("#!/bin/sh\nexec llvm-config-9 $@\n").has_value());
        CHECK_FALSE(ShimActivator::parseShimTarget("#!/bin/sh\nexec '/opt/llvm/bin/llvm-config\n").has_value());
        CHECK_FALSE(ShimActivator::parseShimTarget("echo \"\"").has_value());
        CHECK_FALSE(ShimActivator::parseShimTarget("").has_value());
    }
}

TEST_CASE("Batch shims refuse paths cmd.exe would expand") {
    for (const std::string dir : {"100%", "wow!", "a^b"}) {
        CAPTURE(dir);
        TempTestDir temp{"llvmsel_activator"};
        InstallationStore store{temp.path(dir + "/versions")};
        auto key = make_key("9.0.0");
        make_fake_installation(store.root(), key);

        ShimActivator activator(store, temp.path("bin"), ShimStyle::Batch);
        auto result = activator.activate(key);
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::INVALID_ARGUMENT);
        CHECK_FALSE(path_exists(activator.linkPath()));
    }
}

// =============================================================================
// Behavior shared by both mechanisms
// =============================================================================

#ifndef _WIN32

namespace {

void exercise_lifecycle(ActivationFixture& f, Activator& activator) {
    auto k1 = make_key("8.0.1");
    auto k2 = make_key("9.0.0", BuildType::Debug);
    make_fake_installation(f.store.root(), k1);
    make_fake_installation(f.store.root(), k2);

    SUBCASE("nothing is active initially") {
        auto status = activator.currentActive();
        CHECK(status.state == ActiveState::None);
        CHECK_FALSE(status.key.has_value());
    }

    SUBCASE("activating a missing key fails and creates nothing") {
        auto result = activator.activate(make_key("7.0.0"));
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::NOT_INSTALLED);
        CHECK_FALSE(path_exists(activator.linkPath()));
    }

    SUBCASE("activate makes the well-known command run the installation") {
        REQUIRE(activator.activate(k1).isOk());

        auto status = activator.currentActive();
        CHECK(status.state == ActiveState::Active);
        REQUIRE(status.key.has_value());
        CHECK(*status.key == k1);

        auto output = run_and_capture("\"" + activator.linkPath() + "\" --version");
        REQUIRE(output.has_value());
        CHECK(*output == "8.0.1");
        CHECK(output == run_and_capture("\"" + f.store.queryExecutablePath(k1) + "\" --version"));
    }

    SUBCASE("arguments and exit status pass through unchanged") {
        auto k3 = make_key("10.0.0");
        make_fake_installation(f.store.root(), k3);
        write_text_file(f.store.queryExecutablePath(k3), "#!/bin/sh\necho \"$#:$1\"\nexit 3\n");
        REQUIRE(activator.activate(k3).isOk());

        auto via_link = run_command(shell_quote(activator.linkPath()) + " 'a b'");
        CHECK(via_link.output == "1:a b");
        CHECK(via_link.exit_code == 3);

        auto direct = run_command(shell_quote(f.store.queryExecutablePath(k3)) + " 'a b'");
        CHECK(via_link.output == direct.output);
        CHECK(via_link.exit_code == direct.exit_code);
    }

    SUBCASE("switching versions replaces the artifact") {
        REQUIRE(activator.activate(k1).isOk());
        REQUIRE(activator.activate(k2).isOk());

        auto status = activator.currentActive();
        CHECK(status.state == ActiveState::Active);
        REQUIRE(status.key.has_value());
        CHECK(*status.key == k2);

        CHECK(run_and_capture("\"" + activator.linkPath() + "\" --version") == std::string("9.0.0"));

        // No temp artifacts left behind
        auto entries = f.binEntries();
        REQUIRE(entries.size() == 1);
        CHECK(entries[0] == get_filename(activator.linkPath()));
    }

    SUBCASE("activating a missing key keeps the current artifact") {
        REQUIRE(activator.activate(k1).isOk());
        auto result = activator.activate(make_key("7.0.0"));
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::NOT_INSTALLED);

        auto status = activator.currentActive();
        CHECK(status.state == ActiveState::Active);
        CHECK(status.key == k1);
    }

    SUBCASE("removing the active version leaves it dangling") {
        REQUIRE(activator.activate(k1).isOk());
        REQUIRE(f.store.remove(k1).isOk());

        auto status = activator.currentActive();
        CHECK(status.state == ActiveState::Dangling);
        REQUIRE(status.key.has_value());
        CHECK(*status.key == k1);

        // Re-activation repairs it
        REQUIRE(activator.activate(k2).isOk());
        CHECK(activator.currentActive().state == ActiveState::Active);
    }

    SUBCASE("removing another version does not touch the artifact") {
        REQUIRE(activator.activate(k1).isOk());
        REQUIRE(f.store.remove(k2).isOk());
        CHECK(activator.currentActive().state == ActiveState::Active);
        CHECK(activator.currentActive().key == k1);
    }
}

} // namespace

TEST_CASE("Activator lifecycle") {
    SUBCASE("symlink") {
        ActivationFixture f;
        SymlinkActivator activator(f.store, f.bin_dir);
        exercise_lifecycle(f, activator);
    }

    SUBCASE("shell shim") {
        ActivationFixture f;
        ShimActivator activator(f.store, f.bin_dir, ShimStyle::Shell);
        exercise_lifecycle(f, activator);
    }
}

TEST_CASE("Activation works for a versions root with shell metacharacters") {
    TempTestDir temp{"llvmsel_activator"};
    InstallationStore store{temp.path("it's $HOME `id` \\x/versions")};
    std::string bin_dir = temp.path("bin");
    auto key = make_key("9.0.0");
    make_fake_installation(store.root(), key);

    auto check_runs = [&](Activator& activator) {
        REQUIRE(activator.activate(key).isOk());

        auto status = activator.currentActive();
        CHECK(status.state == ActiveState::Active);
        CHECK(status.key == key);

        auto result = run_command(shell_quote(activator.linkPath()) + " --version");
        CHECK(result.exit_code == 0);
        CHECK(result.output == "9.0.0");
    };

    SUBCASE("shell shim") {
        ShimActivator activator(store, bin_dir, ShimStyle::Shell);
        check_runs(activator);
    }

    SUBCASE("symlink") {
        SymlinkActivator activator(store, bin_dir);
        check_runs(activator);
    }
}

TEST_CASE("Activator reports foreign artifacts as unrecognized") {
    ActivationFixture f;
    std::filesystem::create_directories(f.bin_dir);
    SymlinkActivator activator(f.store, f.bin_dir);

    SUBCASE("symlink outside the store") {
        std::filesystem::create_symlink("/usr/lib/llvm-14/bin/llvm-config", activator.linkPath());
        auto status = activator.currentActive();
        CHECK(status.state == ActiveState::Unrecognized);
        CHECK(status.target == "/usr/lib/llvm-14/bin/llvm-config");
        CHECK_FALSE(status.key.has_value());
    }

    SUBCASE("symlink into the store with a foreign name") {
        std::filesystem::create_symlink(f.store.root() + "/nightly/bin/llvm-config",
                                        activator.linkPath());
        CHECK(activator.currentActive().state == ActiveState::Unrecognized);
    }

    SUBCASE("regular file") {
        write_text_file(activator.linkPath(), "#!/bin/sh\n");
        CHECK(activator.currentActive().state == ActiveState::Unrecognized);
    }

    SUBCASE("activation replaces a foreign artifact") {
        auto key = make_key("9.0.0");
        make_fake_installation(f.store.root(), key);
        std::filesystem::create_symlink("/usr/lib/llvm-14/bin/llvm-config", activator.linkPath());

        REQUIRE(activator.activate(key).isOk());
        CHECK(activator.currentActive().state == ActiveState::Active);
    }
}

TEST_CASE("SymlinkActivator resolves relative link targets against the bin dir") {
    ActivationFixture f;
    auto key = make_key("9.0.0");
    make_fake_installation(f.store.root(), key);
    std::filesystem::create_directories(f.bin_dir);

    SymlinkActivator activator(f.store, f.bin_dir);
    std::filesystem::create_symlink("../versions/9.0.0-Release/bin/llvm-config", activator.linkPath());

    auto status = activator.currentActive();
    CHECK(status.state == ActiveState::Active);
    CHECK(status.key == key);
}

TEST_CASE("SymlinkActivator creates the bin dir on first activation") {
    ActivationFixture f;
    auto key = make_key("9.0.0");
    make_fake_installation(f.store.root(), key);

    SymlinkActivator activator(f.store, f.bin_dir + "/nested");
    REQUIRE(activator.activate(key).isOk());
    CHECK(is_symlink(activator.linkPath()));
    CHECK(read_symlink(activator.linkPath()) == f.store.queryExecutablePath(key));
}

TEST_CASE("ShimActivator writes an executable script") {
    ActivationFixture f;
    auto key = make_key("9.0.0");
    make_fake_installation(f.store.root(), key);

    ShimActivator activator(f.store, f.bin_dir, ShimStyle::Shell);
    REQUIRE(activator.activate(key).isOk());

    CHECK(read_text_file(activator.linkPath()) ==
          ShimActivator::renderShim(ShimStyle::Shell, f.store.queryExecutablePath(key)));
    auto perms = std::filesystem::status(activator.linkPath()).permissions();
    CHECK((perms & std::filesystem::perms::owner_exec) != std::filesystem::perms::none);
    CHECK((perms & std::filesystem::perms::others_exec) != std::filesystem::perms::none);
}

TEST_CASE("Concurrent readers never observe a missing command") {
    ActivationFixture f;
    auto k1 = make_key("8.0.1");
    auto k2 = make_key("9.0.0");
    make_fake_installation(f.store.root(), k1);
    make_fake_installation(f.store.root(), k2);

    SymlinkActivator activator(f.store, f.bin_dir);
    REQUIRE(activator.activate(k1).isOk());

    std::atomic<bool> done{false};
    std::atomic<int> misses{0};
    std::atomic<int> reads{0};
    std::string link = activator.linkPath();

    std::thread reader([&] {
        while (!done.load()) {
            // exists() follows the link, so both the entry and its target must be present
            std::error_code ec;
            if (!std::filesystem::exists(link, ec)) {
                misses++;
            }
            reads++;
        }
    });

    bool all_ok = true;
    for (int i = 0; i < 200; ++i) {
        all_ok = activator.activate(i % 2 == 0 ? k2 : k1).isOk() && all_ok;
    }
    done = true;
    reader.join();

    CHECK(all_ok);
    CHECK(reads.load() > 0);
    CHECK(misses.load() == 0);
    CHECK(activator.currentActive().key == k1);
    CHECK(f.binEntries().size() == 1);
}

TEST_CASE("Activation into a read-only bin dir reports PERMISSION_DENIED") {
    if (geteuid() == 0) {
        MESSAGE("skipped: running as root");
        return;
    }

    ActivationFixture f;
    auto key = make_key("9.0.0");
    make_fake_installation(f.store.root(), key);
    std::filesystem::create_directories(f.bin_dir);
    std::filesystem::permissions(f.bin_dir, std::filesystem::perms::owner_read |
                                                std::filesystem::perms::owner_exec);

    SymlinkActivator symlink(f.store, f.bin_dir);
    auto result = symlink.activate(key);
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::PERMISSION_DENIED);

    ShimActivator shim(f.store, f.bin_dir, ShimStyle::Shell);
    auto shim_result = shim.activate(key);
    REQUIRE(shim_result.isErr());
    CHECK(shim_result.error().code() == ErrorCode::PERMISSION_DENIED);

    CHECK(symlink.currentActive().state == ActiveState::None);

    std::filesystem::permissions(f.bin_dir, std::filesystem::perms::owner_all);
}

#endif
