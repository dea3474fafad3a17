#include <catch2/catch_test_macros.hpp>

#include "view/group_unifier.hpp"

#include <string>
#include <vector>

namespace {

TmuxPane agent_pane(const std::string& id, const std::string& cwd, const std::string& root = "",
                    const std::string& name = "") {
    TmuxPane p;
    p.pane_id = id;
    p.cwd = cwd;
    p.agent_type = AgentType::Claude;
    p.agent_status = AgentStatus::Idle;
    if (!root.empty()) {
        p.git_repo_root = root;
        p.git_repo_name = name;
        p.git_branch = "main";
    }
    return p;
}

Notification note(int64_t id, const std::string& pane, const std::string& repo, const std::string& root,
                  const std::string& created_at) {
    Notification n;
    n.id = id;
    n.badge = "Stop";
    n.tmux_pane = pane;
    n.repo = repo;
    n.repo_root = root;
    n.created_at = created_at;
    return n;
}

const UnifiedGroup* find_group(const std::vector<UnifiedGroup>& groups, const std::string& key) {
    for (auto& g : groups) {
        if (g.key == key) return &g;
    }
    return nullptr;
}

} // namespace

TEST_CASE("Group unifier", "[view]") {

    SECTION("NotificationAttachesToItsPane") {
        std::vector<TmuxPane> panes{agent_pane("%1", "/src/api", "/src/api", "api")};
        std::vector<Notification> notes{note(1, "%1", "api", "/src/api", "2026-01-01 10:00:00")};

        auto groups = unify_groups(panes, notes);
        REQUIRE(groups.size() == 1);
        REQUIRE(groups[0].key == "/src/api");
        REQUIRE(groups[0].name == "api");
        REQUIRE(groups[0].git_branch == "main");
        REQUIRE(groups[0].panes.size() == 1);
        REQUIRE(groups[0].panes[0].notification.has_value());
        REQUIRE(groups[0].panes[0].notification->id == 1);
        REQUIRE(groups[0].orphans.empty());
    }

    SECTION("UnmatchedNotificationsBecomeOrphans") {
        std::vector<TmuxPane> panes{agent_pane("%1", "/src/api", "/src/api", "api")};
        std::vector<Notification> notes{
            note(1, "%9", "web", "/src/web", "2026-01-01 10:00:00"),
            note(2, "", "api", "/src/api", "2026-01-01 10:00:01"),
        };

        auto groups = unify_groups(panes, notes);
        REQUIRE(groups.size() == 2);

        auto* web = find_group(groups, "/src/web");
        REQUIRE(web);
        REQUIRE(web->name == "web");
        REQUIRE(web->panes.empty());
        REQUIRE(web->orphans.size() == 1);

        auto* api = find_group(groups, "/src/api");
        REQUIRE(api);
        REQUIRE_FALSE(api->panes[0].notification.has_value());
        REQUIRE(api->orphans.size() == 1);
        REQUIRE(api->orphans[0].id == 2);
    }

    SECTION("EveryNotificationAppearsOnce") {
        std::vector<TmuxPane> panes{
            agent_pane("%1", "/src/api", "/src/api", "api"),
            agent_pane("%2", "/tmp/scratch"),
        };
        std::vector<Notification> notes{
            note(1, "%1", "api", "/src/api", "2026-01-01 10:00:00"),
            note(2, "%2", "scratch", "", "2026-01-01 10:00:01"),
            note(3, "%7", "api", "/src/api", "2026-01-01 10:00:02"),
            note(4, "", "", "", "2026-01-01 10:00:03"),
        };

        auto groups = unify_groups(panes, notes);
        size_t seen = 0;
        for (auto& g : groups) {
            for (auto& item : g.panes) seen += item.notification ? 1 : 0;
            seen += g.orphans.size();
        }
        REQUIRE(seen == notes.size());
    }

    SECTION("NotificationWithoutKeyGoesToOther") {
        std::vector<Notification> notes{note(1, "", "", "", "2026-01-01 10:00:00")};

        auto groups = unify_groups({}, notes);
        REQUIRE(groups.size() == 1);
        REQUIRE(groups[0].synthetic);
        REQUIRE(groups[0].name == kSyntheticGroupName);
        REQUIRE(groups[0].orphans.size() == 1);
    }

    SECTION("OrphanNameFallsBackToRootBasename") {
        std::vector<Notification> notes{note(1, "", "", "/src/tools", "2026-01-01 10:00:00")};

        auto groups = unify_groups({}, notes);
        REQUIRE(groups.size() == 1);
        REQUIRE(groups[0].key == "/src/tools");
        REQUIRE(groups[0].name == "tools");
        REQUIRE_FALSE(groups[0].synthetic);
    }

    SECTION("PaneWithoutGitGroupsByCwd") {
        std::vector<TmuxPane> panes{agent_pane("%1", "/home/dev/notes"), agent_pane("%2", "/home/dev/notes")};

        auto groups = unify_groups(panes, {});
        REQUIRE(groups.size() == 1);
        REQUIRE(groups[0].key == "/home/dev/notes");
        REQUIRE(groups[0].name == "notes");
        REQUIRE(groups[0].panes.size() == 2);
        REQUIRE_FALSE(groups[0].git_branch.has_value());
    }

    SECTION("AgentPanesOnly") {
        auto shell = agent_pane("%2", "/src/api", "/src/api", "api");
        shell.agent_type.reset();
        shell.agent_status.reset();
        auto noted_shell = agent_pane("%3", "/src/api", "/src/api", "api");
        noted_shell.agent_type.reset();
        noted_shell.agent_status.reset();

        std::vector<TmuxPane> panes{agent_pane("%1", "/src/api", "/src/api", "api"), shell, noted_shell};
        std::vector<Notification> notes{note(1, "%3", "api", "/src/api", "2026-01-01 10:00:00")};

        auto filtered = unify_groups(panes, notes, {.agent_panes_only = true});
        REQUIRE(filtered.size() == 1);
        REQUIRE(filtered[0].panes.size() == 2);
        for (auto& item : filtered[0].panes) REQUIRE(item.pane.pane_id != "%2");

        auto all = unify_groups(panes, notes, {.agent_panes_only = false});
        REQUIRE(all[0].panes.size() == 3);
    }

    SECTION("NotifiedOnlyHidesQuietPanes") {
        std::vector<TmuxPane> panes{
            agent_pane("%1", "/src/api", "/src/api", "api"),
            agent_pane("%2", "/src/api", "/src/api", "api"),
            agent_pane("%3", "/src/web", "/src/web", "web"),
        };
        std::vector<Notification> notes{
            note(1, "%2", "api", "/src/api", "2026-01-01 10:00:00"),
            note(2, "", "cli", "/src/cli", "2026-01-01 10:00:01"),
        };

        auto groups = unify_groups(panes, notes, UnifyOptions{.agent_panes_only = true, .notified_only = true});
        REQUIRE(groups.size() == 2);
        REQUIRE_FALSE(find_group(groups, "/src/web"));

        auto* api = find_group(groups, "/src/api");
        REQUIRE(api);
        REQUIRE(api->panes.size() == 1);
        REQUIRE(api->panes[0].pane.pane_id == "%2");

        auto* cli = find_group(groups, "/src/cli");
        REQUIRE(cli);
        REQUIRE(cli->orphans.size() == 1);

        REQUIRE(unify_groups(panes, notes).size() == 3);
    }

    SECTION("GroupsOrderedByLatestNotification") {
        std::vector<TmuxPane> panes{
            agent_pane("%1", "/src/api", "/src/api", "api"),
            agent_pane("%2", "/src/web", "/src/web", "web"),
            agent_pane("%3", "/src/cli", "/src/cli", "cli"),
            agent_pane("%4", "/src/bot", "/src/bot", "bot"),
        };
        std::vector<Notification> notes{
            note(1, "%1", "api", "/src/api", "2026-01-01 10:00:00"),
            note(2, "%2", "web", "/src/web", "2026-01-01 10:00:05"),
        };

        auto groups = unify_groups(panes, notes);
        REQUIRE(groups.size() == 4);
        REQUIRE(groups[0].name == "web");
        REQUIRE(groups[1].name == "api");
        // Quiet groups follow alphabetically.
        REQUIRE(groups[2].name == "bot");
        REQUIRE(groups[3].name == "cli");
    }

    SECTION("SameTimestampOrdersById") {
        std::vector<Notification> notes{
            note(1, "", "api", "/src/api", "2026-01-01 10:00:00"),
            note(2, "", "web", "/src/web", "2026-01-01 10:00:00"),
        };

        auto groups = unify_groups({}, notes);
        REQUIRE(groups[0].name == "web");
        REQUIRE(groups[1].name == "api");
    }

    SECTION("PanesWithNotificationsComeFirst") {
        std::vector<TmuxPane> panes{
            agent_pane("%1", "/src/api", "/src/api", "api"),
            agent_pane("%2", "/src/api", "/src/api", "api"),
            agent_pane("%3", "/src/api", "/src/api", "api"),
        };
        std::vector<Notification> notes{
            note(1, "%3", "api", "/src/api", "2026-01-01 10:00:00"),
            note(2, "%2", "api", "/src/api", "2026-01-01 10:00:01"),
        };

        auto groups = unify_groups(panes, notes);
        REQUIRE(groups.size() == 1);
        auto& items = groups[0].panes;
        REQUIRE(items[0].pane.pane_id == "%2");
        REQUIRE(items[1].pane.pane_id == "%3");
        REQUIRE(items[2].pane.pane_id == "%1");
    }

    SECTION("OrphansNewestFirst") {
        std::vector<Notification> notes{
            note(1, "", "api", "/src/api", "2026-01-01 10:00:00"),
            note(2, "", "api", "/src/api", "2026-01-01 10:00:02"),
            note(3, "", "api", "/src/api", "2026-01-01 10:00:01"),
        };

        auto groups = unify_groups({}, notes);
        REQUIRE(groups[0].orphans[0].id == 2);
        REQUIRE(groups[0].orphans[1].id == 3);
        REQUIRE(groups[0].orphans[2].id == 1);
        REQUIRE(groups[0].latest()->id == 2);
    }

    SECTION("ToJson") {
        std::vector<TmuxPane> panes{agent_pane("%1", "/src/api", "/src/api", "api")};
        std::vector<Notification> notes{note(1, "%1", "api", "/src/api", "2026-01-01 10:00:00")};

        auto j = to_json(unify_groups(panes, notes)[0]);
        REQUIRE(j["key"] == "/src/api");
        REQUIRE(j["git_branch"] == "main");
        REQUIRE(j["synthetic"] == false);
        REQUIRE(j["panes"].size() == 1);
        REQUIRE(j["panes"][0]["notification"]["id"] == 1);
        REQUIRE(j["orphans"].empty());
    }
}
