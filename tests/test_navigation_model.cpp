#include <catch2/catch_test_macros.hpp>

#include "view/group_unifier.hpp"
#include "view/navigation_model.hpp"

#include <string>
#include <vector>

namespace {

TmuxPane agent_pane(const std::string& id, const std::string& repo) {
    TmuxPane p;
    p.pane_id = id;
    p.cwd = "/src/" + repo;
    p.agent_type = AgentType::Claude;
    p.agent_status = AgentStatus::Idle;
    p.git_repo_root = "/src/" + repo;
    p.git_repo_name = repo;
    return p;
}

Notification note(int64_t id, const std::string& pane, const std::string& repo, const std::string& created_at) {
    Notification n;
    n.id = id;
    n.badge = "Stop";
    n.tmux_pane = pane;
    n.repo = repo;
    n.repo_root = "/src/" + repo;
    n.terminal_bundle_id = "kitty";
    n.created_at = created_at;
    return n;
}

// Rows, once flattened:
//   0 web header
//   1   %2 (notification 2)
//   2   %4
//   3 api header
//   4   %1 (notification 1)
//   5   orphan 3
//   6 cli header (no notifications, collapsed)
std::vector<UnifiedGroup> sample_groups() {
    std::vector<TmuxPane> panes{
        agent_pane("%1", "api"),
        agent_pane("%2", "web"),
        agent_pane("%3", "cli"),
        agent_pane("%4", "web"),
    };
    std::vector<Notification> notes{
        note(1, "%1", "api", "2026-01-01 10:00:00"),
        note(3, "", "api", "2026-01-01 10:00:01"),
        note(2, "%2", "web", "2026-01-01 10:00:05"),
    };
    return unify_groups(panes, notes);
}

} // namespace

TEST_CASE("Navigation model", "[view]") {
    NavigationModel nav;
    nav.rebuild(sample_groups());

    SECTION("FlattenRows") {
        auto& rows = nav.rows();
        REQUIRE(rows.size() == 7);
        REQUIRE(rows[0].kind == RowKind::GroupHeader);
        REQUIRE(rows[0].group_key == "/src/web");
        REQUIRE(rows[1].kind == RowKind::PaneItem);
        REQUIRE(rows[1].pane_id == "%2");
        REQUIRE(rows[1].notification_id == 2);
        REQUIRE(rows[1].terminal_bundle_id == "kitty");
        REQUIRE(rows[2].pane_id == "%4");
        REQUIRE(rows[2].notification_id == 0);
        REQUIRE(rows[3].group_key == "/src/api");
        REQUIRE(rows[5].kind == RowKind::OrphanNotification);
        REQUIRE(rows[5].notification_id == 3);
        REQUIRE(rows[6].kind == RowKind::GroupHeader);
        REQUIRE(rows[6].group_key == "/src/cli");
        REQUIRE_FALSE(nav.selected().has_value());
    }

    SECTION("QuietGroupCollapsedUntilToggled") {
        REQUIRE(nav.is_collapsed("/src/cli"));
        REQUIRE_FALSE(nav.is_collapsed("/src/web"));

        nav.toggle_collapse("/src/cli");
        REQUIRE_FALSE(nav.is_collapsed("/src/cli"));
        REQUIRE(nav.rows().size() == 8);
        REQUIRE(nav.rows()[7].pane_id == "%3");

        // The user's choice survives a rebuild.
        nav.rebuild(sample_groups());
        REQUIRE_FALSE(nav.is_collapsed("/src/cli"));

        nav.toggle_collapse("/src/web");
        REQUIRE(nav.is_collapsed("/src/web"));
        REQUIRE(nav.rows().size() == 6);
    }

    SECTION("MovementIsClamped") {
        nav.move_prev();
        REQUIRE(nav.selected() == 0u);
        nav.move_prev();
        REQUIRE(nav.selected() == 0u);

        for (int i = 0; i < 10; i++) nav.move_next();
        REQUIRE(nav.selected() == 6u);

        nav.clear_selection();
        nav.move_next();
        REQUIRE(nav.selected() == 0u);
    }

    SECTION("NotificationJumps") {
        nav.next_notification();
        REQUIRE(nav.selected() == 1u);
        nav.next_notification();
        REQUIRE(nav.selected() == 4u);
        nav.next_notification();
        REQUIRE(nav.selected() == 5u);
        nav.next_notification();
        REQUIRE(nav.selected() == 5u);

        nav.prev_notification();
        REQUIRE(nav.selected() == 4u);
        nav.prev_notification();
        REQUIRE(nav.selected() == 1u);
        nav.prev_notification();
        REQUIRE(nav.selected() == 1u);

        nav.clear_selection();
        nav.prev_notification();
        REQUIRE(nav.selected() == 5u);
    }

    SECTION("ActivateWithoutSelectionClosesPanel") {
        REQUIRE(nav.activate().kind == NavAction::Kind::ClosePanel);
    }

    SECTION("ActivatePaneRow") {
        REQUIRE(nav.select({RowKind::PaneItem, "/src/web", "%2", 2, {}}));
        auto action = nav.activate();
        REQUIRE(action.kind == NavAction::Kind::FocusPane);
        REQUIRE(action.group_key == "/src/web");
        REQUIRE(action.pane_id == "%2");
        REQUIRE(action.notification_id == 2);
        REQUIRE(action.terminal_bundle_id == "kitty");
    }

    SECTION("ActivateOrphanRow") {
        nav.next_notification();
        nav.next_notification();
        nav.next_notification();
        auto action = nav.activate();
        REQUIRE(action.kind == NavAction::Kind::OpenNotification);
        REQUIRE(action.notification_id == 3);
        REQUIRE(action.group_key == "/src/api");
    }

    SECTION("ActivateHeaderTogglesGroup") {
        nav.move_next();
        auto action = nav.activate();
        REQUIRE(action.kind == NavAction::Kind::ToggleGroup);
        REQUIRE(action.group_key == "/src/web");
        REQUIRE(nav.is_collapsed("/src/web"));
        REQUIRE(nav.selected() == 0u);
        REQUIRE(nav.rows().size() == 5);
    }

    SECTION("CollapsingMovesSelectionToHeader") {
        REQUIRE(nav.select({RowKind::PaneItem, "/src/api", "%1", 1, {}}));
        nav.toggle_collapse("/src/api");
        REQUIRE(nav.selected_row()->kind == RowKind::GroupHeader);
        REQUIRE(nav.selected_row()->group_key == "/src/api");
    }

    SECTION("DeleteSelected") {
        REQUIRE_FALSE(nav.delete_selected().has_value());

        nav.move_next();
        REQUIRE_FALSE(nav.delete_selected().has_value());

        nav.move_next();
        nav.move_next();
        REQUIRE_FALSE(nav.delete_selected().has_value());

        REQUIRE(nav.select({RowKind::OrphanNotification, "/src/api", "", 3, {}}));
        auto action = nav.delete_selected();
        REQUIRE(action.has_value());
        REQUIRE(action->kind == NavAction::Kind::DeleteNotification);
        REQUIRE(action->notification_id == 3);
    }

    SECTION("DeleteGroupFromAnyRow") {
        REQUIRE_FALSE(nav.delete_group().has_value());

        REQUIRE(nav.select({RowKind::PaneItem, "/src/web", "%4", 0, {}}));
        auto action = nav.delete_group();
        REQUIRE(action.has_value());
        REQUIRE(action->kind == NavAction::Kind::DeleteGroup);
        REQUIRE(action->group_key == "/src/web");
    }

    SECTION("SelectionFollowsEntityAcrossRebuild") {
        REQUIRE(nav.select({RowKind::PaneItem, "/src/api", "%1", 1, {}}));
        REQUIRE(nav.selected() == 4u);

        // web loses its notification and drops below api.
        nav.rebuild(unify_groups({agent_pane("%1", "api"), agent_pane("%2", "web")},
                                 {note(1, "%1", "api", "2026-01-01 10:00:00")}));
        REQUIRE(nav.selected() == 1u);
        REQUIRE(nav.selected_row()->pane_id == "%1");

        // The pane closes but its group survives through an orphan.
        nav.rebuild(unify_groups({}, {note(7, "", "api", "2026-01-01 10:00:09")}));
        REQUIRE(nav.selected_row()->kind == RowKind::GroupHeader);
        REQUIRE(nav.selected_row()->group_key == "/src/api");

        nav.rebuild({});
        REQUIRE_FALSE(nav.selected().has_value());
        REQUIRE(nav.rows().empty());
    }

    SECTION("GroupLimitCapsOrphans") {
        std::vector<Notification> notes{
            note(1, "", "api", "2026-01-01 10:00:00"),
            note(2, "", "api", "2026-01-01 10:00:01"),
            note(3, "", "api", "2026-01-01 10:00:02"),
        };

        NavigationModel limited(2);
        limited.rebuild(unify_groups({}, notes));
        REQUIRE(limited.rows().size() == 3);
        REQUIRE(limited.rows()[1].notification_id == 3);
        REQUIRE(limited.rows()[2].notification_id == 2);

        NavigationModel unlimited(0);
        unlimited.rebuild(unify_groups({}, notes));
        REQUIRE(unlimited.rows().size() == 4);
    }

    SECTION("ToJson") {
        nav.move_next();
        auto j = nav.to_json();
        REQUIRE(j["selected"] == 0);
        REQUIRE(j["groups"].size() == 3);
        REQUIRE(j["groups"][2]["collapsed"] == true);
        REQUIRE(j["rows"][0]["kind"] == "group-header");
        REQUIRE(j["rows"][1]["kind"] == "pane-item");
        REQUIRE(j["rows"][5]["kind"] == "orphan-notification");
        REQUIRE(j["rows"][5]["notification_id"] == 3);
    }
}
