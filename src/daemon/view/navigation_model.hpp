#pragma once

#include "view/group_unifier.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

enum class RowKind { GroupHeader, PaneItem, OrphanNotification };

struct NavRow {
    RowKind kind = RowKind::GroupHeader;
    std::string group_key;
    std::string pane_id;
    // 0 when the row has no notification attached.
    int64_t notification_id = 0;
    std::string terminal_bundle_id;
};

struct NavAction {
    enum class Kind {
        ClosePanel,
        ToggleGroup,
        FocusPane,          // pane row: clear its notification (if any) and focus
        OpenNotification,   // orphan row: delete it and focus its recorded pane
        DeleteNotification,
        DeleteGroup,
    };

    Kind kind;
    std::string group_key;
    std::string pane_id;
    int64_t notification_id = 0;
    std::string terminal_bundle_id;
};

std::string to_string(NavAction::Kind kind);

// Keyboard model over the unified groups. The selection is tracked by entity
// (group key, pane id, notification id) and re-resolved after each rebuild.
class NavigationModel {
public:
    explicit NavigationModel(int group_limit = 3);

    void rebuild(std::vector<UnifiedGroup> groups);

    const std::vector<UnifiedGroup>& groups() const { return groups_; }
    const std::vector<NavRow>& rows() const { return rows_; }
    std::optional<size_t> selected() const { return selected_; }
    const NavRow* selected_row() const;

    bool select(const NavRow& identity);
    void clear_selection();

    void move_next();
    void move_prev();
    void next_notification();
    void prev_notification();

    bool is_collapsed(const std::string& group_key) const;
    void toggle_collapse(const std::string& group_key);

    NavAction activate();
    std::optional<NavAction> delete_selected();
    std::optional<NavAction> delete_group();

    nlohmann::json to_json() const;

private:
    void flatten();
    std::optional<size_t> find(const NavRow& identity) const;
    std::optional<size_t> find_header(const std::string& group_key) const;
    const UnifiedGroup* group(const std::string& key) const;

    int group_limit_;
    std::vector<UnifiedGroup> groups_;
    std::vector<NavRow> rows_;
    // Groups whose automatic collapse state was flipped by the user.
    std::set<std::string> toggled_;
    std::optional<size_t> selected_;
};
