#pragma once

#include "models/notification.hpp"
#include "models/tmux_pane.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

struct PaneItem {
    TmuxPane pane;
    std::optional<Notification> notification;
};

struct UnifiedGroup {
    std::string key;
    std::string name;
    std::optional<std::string> git_branch;
    // Holds notifications that carry neither a repository root nor a group name.
    bool synthetic = false;

    std::vector<PaneItem> panes;
    std::vector<Notification> orphans;

    bool has_notifications() const;
    // Newest notification in the group, if any.
    const Notification* latest() const;
};

inline constexpr const char* kSyntheticGroupName = "Other";

struct UnifyOptions {
    // Panes without an agent are dropped unless a notification points at them.
    bool agent_panes_only = true;
    // Only panes with a notification are kept.
    bool notified_only = false;
};

// Rebuilds the whole grouped view from the latest pane list and store snapshot.
// Every notification ends up in the output, either on its pane or as an orphan.
std::vector<UnifiedGroup> unify_groups(const std::vector<TmuxPane>& panes,
                                       const std::vector<Notification>& notifications,
                                       const UnifyOptions& options = {});

nlohmann::json to_json(const UnifiedGroup& group);
