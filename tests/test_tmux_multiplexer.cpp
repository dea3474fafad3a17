#include <catch2/catch_test_macros.hpp>

#include "platform/command_runner.hpp"
#include "platform/linux/git_cli_resolver.hpp"
#include "platform/linux/tmux_multiplexer.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

TEST_CASE("Tmux pane list", "[tmux]") {

    SECTION("ParsesAllFields") {
        auto panes = TmuxMultiplexer::parse_pane_list(
            "%1|||4242|||main|||editor|||/src/api|||1|||1|||1\n"
            "%7|||4300|||scratch|||zsh|||/home/dev/my|dir|||0|||1|||0\n");

        REQUIRE(panes.size() == 2);
        REQUIRE(panes[0].pane_id == "%1");
        REQUIRE(panes[0].pid == 4242);
        REQUIRE(panes[0].session_name == "main");
        REQUIRE(panes[0].window_name == "editor");
        REQUIRE(panes[0].cwd == "/src/api");
        REQUIRE(panes[0].is_active);

        REQUIRE(panes[1].cwd == "/home/dev/my|dir");
        REQUIRE_FALSE(panes[1].is_active);
    }

    SECTION("ActiveNeedsAttachedClient") {
        auto panes = TmuxMultiplexer::parse_pane_list("%1|||10|||s|||w|||/tmp|||1|||1|||0\n");
        REQUIRE(panes.size() == 1);
        REQUIRE_FALSE(panes[0].is_active);

        panes = TmuxMultiplexer::parse_pane_list("%1|||10|||s|||w|||/tmp|||1|||1|||2\n");
        REQUIRE(panes[0].is_active);
    }

    SECTION("SkipsShortLines") {
        auto panes = TmuxMultiplexer::parse_pane_list("garbage\n%2|||x|||s|||w|||/tmp|||0|||0|||0\n\n");
        REQUIRE(panes.size() == 1);
        REQUIRE(panes[0].pane_id == "%2");
        REQUIRE(panes[0].pid == 0);
    }

    SECTION("MissingBinaryReportsError") {
        TmuxMultiplexer mux(500, "panetoast-no-such-tmux");
        auto res = mux.list_panes();
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().starts_with("tmux: "));
        REQUIRE_FALSE(mux.capture_pane("%1").has_value());
    }
}

TEST_CASE("Git remote names", "[git]") {
    REQUIRE(GitCliResolver::repo_name_from_remote("https://github.com/acme/widgets.git") == "widgets");
    REQUIRE(GitCliResolver::repo_name_from_remote("git@github.com:acme/widgets.git\n") == "widgets");
    REQUIRE(GitCliResolver::repo_name_from_remote("https://example.com/acme/widgets/") == "widgets");
    REQUIRE(GitCliResolver::repo_name_from_remote("host:widgets") == "widgets");
    REQUIRE(GitCliResolver::repo_name_from_remote("widgets") == "widgets");
}

TEST_CASE("Command runner", "[process]") {

    SECTION("CollectsStdout") {
        auto res = platform::run_command({"echo", "hello"}, 2000);
        REQUIRE(res.has_value());
        REQUIRE(res->exit_code == 0);
        REQUIRE(res->output == "hello\n");
    }

    SECTION("ReportsExitCode") {
        auto res = platform::run_command({"false"}, 2000);
        REQUIRE(res.has_value());
        REQUIRE(res->exit_code == 1);
    }

    SECTION("KillsSlowChild") {
        auto res = platform::run_command({"sleep", "5"}, 100);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().find("timed out") != std::string::npos);
    }

    SECTION("ConcurrentCallers") {
        std::atomic<int> ok{0};
        std::atomic<bool> done{false};
        auto spawn = [&] {
            for (int i = 0; i < 20; i++) {
                auto res = platform::run_command({"echo", std::to_string(i)}, 2000);
                if (res && res->output == std::to_string(i) + "\n") ok++;
            }
        };

        std::jthread churn([&] {
            while (!done) {
                std::vector<std::string> junk(64, std::string(256, 'x'));
            }
        });
        {
            std::jthread a(spawn);
            std::jthread b(spawn);
        }
        done = true;
        REQUIRE(ok == 40);
    }

    SECTION("MissingBinary") {
        REQUIRE_FALSE(platform::run_command({"panetoast-no-such-binary"}, 1000).has_value());
        REQUIRE_FALSE(platform::run_command({}, 1000).has_value());
    }
}
