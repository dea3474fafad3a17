#pragma once

#include <nlohmann/json.hpp>
#include <set>
#include <string>

struct MuteState {
    bool global_muted = false;
    std::set<std::string> muted_groups;
};

// Owns the persisted mute flags. load() at startup, save() on every change and at exit.
class MuteService {
public:
    explicit MuteService(std::string path);

    bool load();
    bool save() const;

    bool is_muted(const std::string& group_key) const;
    const MuteState& state() const { return state_; }

    bool toggle_global();
    bool toggle_group(const std::string& group_key);

    nlohmann::json to_json() const;

private:
    std::string path_;
    MuteState state_;
};
