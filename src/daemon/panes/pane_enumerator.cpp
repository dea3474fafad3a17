#include "panes/pane_enumerator.hpp"

#include <algorithm>
#include <format>
#include <optional>
#include <print>

PaneEnumerator::PaneEnumerator(Multiplexer& mux, ProcessDetector& processes, GitResolver& git,
                               const StatusDetector& detector, EnumeratorOptions options, bool verbose)
    : mux_(mux), processes_(processes), git_(git), detector_(detector),
      options_(options), verbose_(verbose) {}

std::vector<TmuxPane> PaneEnumerator::enumerate(std::stop_token stop) {
    auto records = mux_.list_panes();
    if (!records) {
        failures_++;
        std::println(stderr, "{} (failure {})", records.error(), failures_);
        return {};
    }
    if (failures_ > 0) log(std::format("tmux reachable again after {} failures", failures_));
    failures_ = 0;

    processes_.refresh();

    std::unordered_map<std::string, std::optional<GitInfo>> git_cache;
    std::unordered_map<std::string, Classification> statuses;
    std::vector<TmuxPane> panes;
    panes.reserve(records->size());

    for (auto& rec : *records) {
        if (stop.stop_requested()) return {};

        TmuxPane pane;
        pane.pane_id = rec.pane_id;
        pane.pid = rec.pid;
        pane.session_name = rec.session_name;
        pane.window_name = rec.window_name;
        pane.cwd = rec.cwd;
        pane.is_active = rec.is_active;

        auto detection = processes_.detect(rec.pid);
        pane.agent_type = agent_type_from_string(detection.agent);

        if (pane.agent_type) {
            std::optional<Classification> previous;
            if (auto it = last_status_.find(rec.pane_id); it != last_status_.end()) previous = it->second;

            Classification cls;
            auto screen = mux_.capture_pane(rec.pane_id);
            if (screen) {
                cls = detector_.classify(pane.agent_type, *screen, previous);
            } else {
                log(screen.error());
                cls = previous.value_or(Classification{AgentStatus::Running, std::nullopt, {}});
            }

            pane.agent_status = cls.status;
            pane.waiting_reason = cls.waiting_reason;
            pane.agent_modes = cls.agent_modes;
            statuses[rec.pane_id] = std::move(cls);
        }

        auto [it, inserted] = git_cache.try_emplace(rec.cwd);
        if (inserted) it->second = git_.resolve(rec.cwd);
        if (it->second) {
            pane.git_repo_root = it->second->repo_root;
            pane.git_repo_name = it->second->repo_name;
            if (!it->second->branch.empty()) pane.git_branch = it->second->branch;
        }

        panes.push_back(std::move(pane));
    }

    // Panes whose agent exited, or that closed, lose their remembered status.
    last_status_ = std::move(statuses);
    return panes;
}

std::chrono::milliseconds PaneEnumerator::next_delay() const {
    int64_t delay = options_.interval_ms;
    if (failures_ >= options_.failure_threshold) {
        int doublings = std::min(failures_ - options_.failure_threshold + 1, 16);
        delay <<= doublings;
        delay = std::min<int64_t>(delay, options_.max_backoff_ms);
    }
    return std::chrono::milliseconds(delay);
}

void PaneEnumerator::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[panetoast] {}", msg);
    }
}
