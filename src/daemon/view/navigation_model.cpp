#include "view/navigation_model.hpp"

#include <algorithm>

std::string to_string(NavAction::Kind kind) {
    switch (kind) {
        case NavAction::Kind::ClosePanel: return "close_panel";
        case NavAction::Kind::ToggleGroup: return "toggle_group";
        case NavAction::Kind::FocusPane: return "focus_pane";
        case NavAction::Kind::OpenNotification: return "open_notification";
        case NavAction::Kind::DeleteNotification: return "delete_notification";
        case NavAction::Kind::DeleteGroup: return "delete_group";
    }
    return "unknown";
}

NavigationModel::NavigationModel(int group_limit)
    : group_limit_(group_limit) {}

void NavigationModel::rebuild(std::vector<UnifiedGroup> groups) {
    std::optional<NavRow> previous;
    if (auto* row = selected_row()) previous = *row;

    groups_ = std::move(groups);
    std::erase_if(toggled_, [this](const std::string& key) { return group(key) == nullptr; });
    flatten();

    selected_.reset();
    if (!previous) return;
    if (auto idx = find(*previous)) {
        selected_ = idx;
    } else if (auto header = find_header(previous->group_key)) {
        selected_ = header;
    }
}

void NavigationModel::flatten() {
    rows_.clear();
    for (auto& g : groups_) {
        rows_.push_back({RowKind::GroupHeader, g.key, {}, 0, {}});
        if (is_collapsed(g.key)) continue;

        for (auto& item : g.panes) {
            NavRow row{RowKind::PaneItem, g.key, item.pane.pane_id, 0, {}};
            if (item.notification) {
                row.notification_id = item.notification->id;
                row.terminal_bundle_id = item.notification->terminal_bundle_id;
            }
            rows_.push_back(std::move(row));
        }

        int shown = 0;
        for (auto& n : g.orphans) {
            if (group_limit_ > 0 && shown >= group_limit_) break;
            rows_.push_back({RowKind::OrphanNotification, g.key, n.tmux_pane, n.id, n.terminal_bundle_id});
            shown++;
        }
    }
}

const NavRow* NavigationModel::selected_row() const {
    if (!selected_ || *selected_ >= rows_.size()) return nullptr;
    return &rows_[*selected_];
}

std::optional<size_t> NavigationModel::find(const NavRow& identity) const {
    for (size_t i = 0; i < rows_.size(); i++) {
        auto& r = rows_[i];
        if (r.kind != identity.kind) continue;
        switch (r.kind) {
            case RowKind::GroupHeader:
                if (r.group_key == identity.group_key) return i;
                break;
            case RowKind::PaneItem:
                if (r.pane_id == identity.pane_id) return i;
                break;
            case RowKind::OrphanNotification:
                if (r.notification_id == identity.notification_id) return i;
                break;
        }
    }
    return std::nullopt;
}

std::optional<size_t> NavigationModel::find_header(const std::string& group_key) const {
    return find(NavRow{RowKind::GroupHeader, group_key, {}, 0, {}});
}

const UnifiedGroup* NavigationModel::group(const std::string& key) const {
    auto it = std::ranges::find_if(groups_, [&](const UnifiedGroup& g) { return g.key == key; });
    return it != groups_.end() ? &*it : nullptr;
}

bool NavigationModel::select(const NavRow& identity) {
    auto idx = find(identity);
    if (!idx) return false;
    selected_ = idx;
    return true;
}

void NavigationModel::clear_selection() {
    selected_.reset();
}

void NavigationModel::move_next() {
    if (rows_.empty()) return;
    selected_ = selected_ ? std::min(*selected_ + 1, rows_.size() - 1) : 0;
}

void NavigationModel::move_prev() {
    if (rows_.empty()) return;
    selected_ = selected_ && *selected_ > 0 ? *selected_ - 1 : 0;
}

void NavigationModel::next_notification() {
    size_t start = selected_ ? *selected_ + 1 : 0;
    for (size_t i = start; i < rows_.size(); i++) {
        if (rows_[i].notification_id != 0) {
            selected_ = i;
            return;
        }
    }
}

void NavigationModel::prev_notification() {
    if (rows_.empty()) return;
    size_t i = selected_ ? *selected_ : rows_.size();
    while (i > 0) {
        i--;
        if (rows_[i].notification_id != 0) {
            selected_ = i;
            return;
        }
    }
}

bool NavigationModel::is_collapsed(const std::string& group_key) const {
    auto* g = group(group_key);
    if (!g) return false;
    bool automatic = !g->has_notifications();
    return toggled_.contains(group_key) ? !automatic : automatic;
}

void NavigationModel::toggle_collapse(const std::string& group_key) {
    std::optional<NavRow> previous;
    if (auto* row = selected_row()) previous = *row;

    if (!toggled_.erase(group_key)) toggled_.insert(group_key);
    flatten();

    selected_.reset();
    if (!previous) return;
    if (auto idx = find(*previous)) {
        selected_ = idx;
    } else {
        selected_ = find_header(previous->group_key);
    }
}

NavAction NavigationModel::activate() {
    auto* row = selected_row();
    if (!row) return {NavAction::Kind::ClosePanel, {}, {}, 0, {}};

    switch (row->kind) {
        case RowKind::GroupHeader: {
            auto key = row->group_key;
            toggle_collapse(key);
            return {NavAction::Kind::ToggleGroup, key, {}, 0, {}};
        }
        case RowKind::PaneItem:
            return {NavAction::Kind::FocusPane, row->group_key, row->pane_id, row->notification_id,
                    row->terminal_bundle_id};
        case RowKind::OrphanNotification:
            return {NavAction::Kind::OpenNotification, row->group_key, row->pane_id, row->notification_id,
                    row->terminal_bundle_id};
    }
    return {NavAction::Kind::ClosePanel, {}, {}, 0, {}};
}

std::optional<NavAction> NavigationModel::delete_selected() {
    auto* row = selected_row();
    if (!row || row->notification_id == 0) return std::nullopt;
    return NavAction{NavAction::Kind::DeleteNotification, row->group_key, row->pane_id, row->notification_id, {}};
}

std::optional<NavAction> NavigationModel::delete_group() {
    auto* row = selected_row();
    if (!row) return std::nullopt;
    return NavAction{NavAction::Kind::DeleteGroup, row->group_key, {}, 0, {}};
}

nlohmann::json NavigationModel::to_json() const {
    nlohmann::json groups = nlohmann::json::array();
    for (auto& g : groups_) {
        auto j = ::to_json(g);
        j["collapsed"] = is_collapsed(g.key);
        groups.push_back(std::move(j));
    }

    nlohmann::json rows = nlohmann::json::array();
    for (auto& r : rows_) {
        const char* kind = r.kind == RowKind::GroupHeader ? "group-header"
                         : r.kind == RowKind::PaneItem    ? "pane-item"
                                                          : "orphan-notification";
        rows.push_back({
            {"kind", kind},
            {"group_key", r.group_key},
            {"pane_id", r.pane_id},
            {"notification_id", r.notification_id},
        });
    }

    return {
        {"groups", groups},
        {"rows", rows},
        {"selected", selected_ ? nlohmann::json(*selected_) : nlohmann::json(nullptr)},
    };
}
