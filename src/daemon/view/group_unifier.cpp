#include "view/group_unifier.hpp"

#include <algorithm>
#include <filesystem>
#include <unordered_map>

namespace {

// Strict "a is newer than b" in store order.
bool newer(const Notification& a, const Notification& b) {
    if (a.created_at != b.created_at) return a.created_at > b.created_at;
    return a.id > b.id;
}

std::string name_for_key(const Notification& n) {
    if (!n.repo.empty()) return n.repo;
    auto name = std::filesystem::path(n.repo_root).filename().string();
    return name.empty() ? n.repo_root : name;
}

} // namespace

bool UnifiedGroup::has_notifications() const {
    return latest() != nullptr;
}

const Notification* UnifiedGroup::latest() const {
    const Notification* best = nullptr;
    for (auto& item : panes) {
        if (item.notification && (!best || newer(*item.notification, *best))) best = &*item.notification;
    }
    for (auto& n : orphans) {
        if (!best || newer(n, *best)) best = &n;
    }
    return best;
}

std::vector<UnifiedGroup> unify_groups(const std::vector<TmuxPane>& panes,
                                       const std::vector<Notification>& notifications,
                                       const UnifyOptions& options) {
    std::unordered_map<std::string, const Notification*> by_pane;
    for (auto& n : notifications) {
        if (n.tmux_pane.empty()) continue;
        auto [it, inserted] = by_pane.try_emplace(n.tmux_pane, &n);
        if (!inserted && newer(n, *it->second)) it->second = &n;
    }

    std::vector<UnifiedGroup> groups;
    std::unordered_map<std::string, size_t> index;
    std::unordered_map<std::string, bool> attached;

    auto group_for = [&](const std::string& key, const std::string& name, bool synthetic) -> UnifiedGroup& {
        auto it = index.find(key);
        if (it != index.end()) return groups[it->second];
        index.emplace(key, groups.size());
        groups.push_back(UnifiedGroup{.key = key, .name = name, .git_branch = std::nullopt,
                                      .synthetic = synthetic, .panes = {}, .orphans = {}});
        return groups.back();
    };

    for (auto& pane : panes) {
        auto match = by_pane.find(pane.pane_id);
        bool has_match = match != by_pane.end();
        if (!has_match && (options.notified_only || (options.agent_panes_only && !pane.agent_type))) continue;

        auto& group = group_for(pane.group_key(), pane.group_name(), false);
        if (!group.git_branch && pane.git_branch) group.git_branch = pane.git_branch;

        PaneItem item{pane, std::nullopt};
        if (has_match) {
            item.notification = *match->second;
            attached[pane.pane_id] = true;
        }
        group.panes.push_back(std::move(item));
    }

    for (auto& n : notifications) {
        if (!n.tmux_pane.empty() && attached.contains(n.tmux_pane) && by_pane[n.tmux_pane] == &n) continue;

        auto key = n.group_key();
        if (key.empty()) {
            group_for(key, kSyntheticGroupName, true).orphans.push_back(n);
        } else {
            group_for(key, name_for_key(n), false).orphans.push_back(n);
        }
    }

    for (auto& group : groups) {
        std::ranges::stable_sort(group.panes, [](const PaneItem& a, const PaneItem& b) {
            if (a.notification && b.notification) return newer(*a.notification, *b.notification);
            return a.notification.has_value() && !b.notification.has_value();
        });
        std::ranges::stable_sort(group.orphans, newer);
    }

    std::ranges::stable_sort(groups, [](const UnifiedGroup& a, const UnifiedGroup& b) {
        auto* la = a.latest();
        auto* lb = b.latest();
        if (la && lb) return newer(*la, *lb);
        if (la || lb) return la != nullptr;
        if (a.name != b.name) return a.name < b.name;
        return a.key < b.key;
    });

    return groups;
}

nlohmann::json to_json(const UnifiedGroup& group) {
    nlohmann::json panes = nlohmann::json::array();
    for (auto& item : group.panes) {
        panes.push_back({
            {"pane", to_json(item.pane)},
            {"notification", item.notification ? to_json(*item.notification) : nlohmann::json(nullptr)},
        });
    }

    nlohmann::json orphans = nlohmann::json::array();
    for (auto& n : group.orphans) orphans.push_back(to_json(n));

    return {
        {"key", group.key},
        {"name", group.name},
        {"git_branch", group.git_branch ? nlohmann::json(*group.git_branch) : nlohmann::json(nullptr)},
        {"synthetic", group.synthetic},
        {"panes", panes},
        {"orphans", orphans},
    };
}
