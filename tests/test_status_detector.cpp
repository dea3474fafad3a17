#include <catch2/catch_test_macros.hpp>

#include "detector/rule_table.hpp"
#include "detector/status_detector.hpp"

#include <string>
#include <vector>

namespace {

const RuleSet& rules() {
    static const RuleSet r = RuleSet::defaults();
    return r;
}

const std::string kClaudeIdle =
    "● Done. The tests pass.\n"
    "\n"
    "────────────────────────────────────────\n"
    "❯ \n"
    "────────────────────────────────────────\n"
    "  ? for shortcuts\n";

const std::string kClaudeBusy =
    "● Reading src/main.cpp\n"
    "\n"
    "✻ Pondering… (12s · ↑ 1.2k tokens · esc to interrupt)\n"
    "\n"
    "────────────────────────────────────────\n"
    "❯ \n"
    "────────────────────────────────────────\n"
    "  ⏵⏵ accept edits on (shift+tab to cycle)\n";

const std::string kClaudePermission =
    "╭──────────────────────────────────────╮\n"
    "│ Bash command                         │\n"
    "│   rm -rf build                       │\n"
    "│ Do you want to proceed?              │\n"
    "│ ❯ 1. Yes                             │\n"
    "│   2. No, and tell Claude what to do  │\n"
    "╰──────────────────────────────────────╯\n";

} // namespace

TEST_CASE("Status detector", "[detector]") {
    StatusDetector detector(rules());

    SECTION("NoAgentHasNoStatus") {
        auto c = detector.classify(std::nullopt, kClaudeIdle);
        REQUIRE_FALSE(c.status.has_value());
        REQUIRE(c.agent_modes.empty());
    }

    SECTION("ClaudeIdlePrompt") {
        auto c = detector.classify(AgentType::Claude, kClaudeIdle);
        REQUIRE(c.status == AgentStatus::Idle);
        REQUIRE_FALSE(c.waiting_reason.has_value());
    }

    SECTION("ClaudeSpinnerIsRunningEvenWithPromptBox") {
        auto c = detector.classify(AgentType::Claude, kClaudeBusy);
        REQUIRE(c.status == AgentStatus::Running);
        REQUIRE(c.agent_modes == std::vector<std::string>{"accept"});
    }

    SECTION("ClaudeFinishedSpinnerLineIsNotRunning") {
        auto screen =
            "✻ Worked for 2m 10s\n"
            "\n"
            "────────────────\n"
            "❯ \n"
            "────────────────\n";
        auto c = detector.classify(AgentType::Claude, screen);
        REQUIRE(c.status == AgentStatus::Idle);
    }

    SECTION("ClaudePermissionDialogWaits") {
        auto c = detector.classify(AgentType::Claude, kClaudePermission);
        REQUIRE(c.status == AgentStatus::Waiting);
        REQUIRE(c.waiting_reason == "respond");
    }

    SECTION("StalePlanCursorAbovePromptIsIgnored") {
        auto screen =
            "Would you like to proceed?\n"
            "❯ 1. Yes, and auto-accept edits\n"
            "  2. No, keep planning\n"
            "\n"
            "● Plan approved.\n"
            "────────────────\n"
            "❯ \n"
            "────────────────\n";
        auto c = detector.classify(AgentType::Claude, screen);
        REQUIRE(c.status == AgentStatus::Idle);
    }

    SECTION("PlanCursorWithoutPromptWaits") {
        auto screen =
            "Would you like to proceed?\n"
            "❯ 1. Yes, and auto-accept edits\n"
            "  2. No, keep planning\n";
        auto c = detector.classify(AgentType::Claude, screen);
        REQUIRE(c.status == AgentStatus::Waiting);
    }

    SECTION("ClaudeModes") {
        auto screen =
            "❯ \n"
            "  ⏸ plan mode on (shift+tab to cycle)\n";
        auto c = detector.classify(AgentType::Claude, screen);
        REQUIRE(c.status == AgentStatus::Idle);
        REQUIRE(c.agent_modes == std::vector<std::string>{"plan"});
    }

    SECTION("FileChangeFooterIsNotUnknownOutput") {
        const std::string screen =
            "● Done.\n"
            "────────────────────────────────────────\n"
            "❯ \n"
            "────────────────────────────────────────\n"
            "  main · api\n"
            "  model: opus\n"
            "  session 2h\n"
            "  4 files +42 -0\n";
        REQUIRE(detector.classify(AgentType::Claude, screen).status == AgentStatus::Idle);
    }

    SECTION("SeparatorsDoNotUseUpScanWindow") {
        std::string screen = "● Done.\n❯ \n";
        for (int i = 0; i < 40; i++) screen += "────────────────────────────────────────\n";
        REQUIRE(detector.classify(AgentType::Claude, screen).status == AgentStatus::Idle);
    }

    SECTION("UnknownOutputRetainsPreviousStatus") {
        auto screen =
            "line one of output\n"
            "line two of output\n"
            "line three of output\n"
            "line four of output\n"
            "line five of output\n";
        Classification previous{AgentStatus::Idle, std::nullopt, {}};
        REQUIRE(detector.classify(AgentType::Claude, screen, previous).status == AgentStatus::Idle);
        REQUIRE(detector.classify(AgentType::Claude, screen).status == AgentStatus::Running);
    }

    SECTION("CodexIdle") {
        auto screen =
            "› \n"
            "\n"
            "  ? for shortcuts                          100% context left\n";
        REQUIRE(detector.classify(AgentType::Codex, screen).status == AgentStatus::Idle);
    }

    SECTION("CodexWorking") {
        auto screen =
            "• Working (14s • esc to interrupt)\n"
            "\n"
            "› \n";
        REQUIRE(detector.classify(AgentType::Codex, screen).status == AgentStatus::Running);
    }

    SECTION("CodexPermissionBannerWaits") {
        auto screen =
            "  Would you like to run the following command?\n"
            "  $ cargo test\n"
            "› 1. Yes, proceed\n"
            "  2. No, and tell Codex what to do differently\n";
        auto c = detector.classify(AgentType::Codex, screen);
        REQUIRE(c.status == AgentStatus::Waiting);
        REQUIRE(c.waiting_reason == "respond");
    }

    SECTION("OpenCodeQuietIsIdle") {
        auto screen =
            "┃  Fixed the failing test.\n"
            "┃  ▣  Build · claude-sonnet\n";
        auto c = detector.classify(AgentType::OpenCode, screen);
        REQUIRE(c.status == AgentStatus::Idle);
        REQUIRE(c.agent_modes == std::vector<std::string>{"build"});
    }

    SECTION("OpenCodeBusyAndPermission") {
        REQUIRE(detector.classify(AgentType::OpenCode, "⬝⬝⬝■■  esc interrupt\n").status == AgentStatus::Running);

        auto c = detector.classify(AgentType::OpenCode, "△ Permission Required\n  Allow (a)  Reject (r)\n");
        REQUIRE(c.status == AgentStatus::Waiting);
        REQUIRE(c.waiting_reason == "respond");
    }

    SECTION("AnsiSequencesAreIgnored") {
        auto screen = "\x1b[2m────────\x1b[0m\n\x1b[1m❯\x1b[0m \n\x1b[2m────────\x1b[0m\n";
        REQUIRE(detector.classify(AgentType::Claude, screen).status == AgentStatus::Idle);
    }

    SECTION("Pure") {
        auto a = detector.classify(AgentType::Claude, kClaudeBusy);
        auto b = detector.classify(AgentType::Claude, kClaudeBusy);
        REQUIRE(a == b);
    }
}
