#include "mute_service.hpp"

#include <filesystem>
#include <fstream>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

MuteService::MuteService(std::string path)
    : path_(std::move(path)) {}

bool MuteService::load() {
    state_ = {};
    std::ifstream f(path_);
    if (!f.is_open()) return true;

    try {
        auto j = json::parse(f);
        state_.global_muted = j.value("global_muted", false);
        if (j.contains("muted_groups")) {
            for (auto& g : j["muted_groups"]) state_.muted_groups.insert(g.get<std::string>());
        }
    } catch (const json::exception& e) {
        std::println(stderr, "mute: parse error in {}: {}", path_, e.what());
        state_ = {};
        return false;
    }
    return true;
}

bool MuteService::save() const {
    if (path_.empty()) return false;

    std::error_code ec;
    fs::path p(path_);
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    auto tmp = path_ + ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f.is_open()) {
            std::println(stderr, "mute: could not write {}", tmp);
            return false;
        }
        f << to_json().dump(2) << "\n";
    }

    fs::rename(tmp, path_, ec);
    if (ec) {
        std::println(stderr, "mute: could not replace {}: {}", path_, ec.message());
        return false;
    }
    return true;
}

bool MuteService::is_muted(const std::string& group_key) const {
    return state_.global_muted || (!group_key.empty() && state_.muted_groups.contains(group_key));
}

bool MuteService::toggle_global() {
    state_.global_muted = !state_.global_muted;
    save();
    return state_.global_muted;
}

bool MuteService::toggle_group(const std::string& group_key) {
    bool muted;
    if (state_.muted_groups.erase(group_key) > 0) {
        muted = false;
    } else {
        state_.muted_groups.insert(group_key);
        muted = true;
    }
    save();
    return muted;
}

json MuteService::to_json() const {
    return {
        {"global_muted", state_.global_muted},
        {"muted_groups", state_.muted_groups},
    };
}
