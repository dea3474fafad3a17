#pragma once

#include "detector/status_detector.hpp"
#include "models/tmux_pane.hpp"
#include "platform/git_resolver.hpp"
#include "platform/multiplexer.hpp"
#include "platform/process_detector.hpp"

#include <chrono>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

struct EnumeratorOptions {
    int interval_ms = 3000;
    int max_backoff_ms = 30000;
    int failure_threshold = 2;
};

// One poll cycle over all tmux panes: agent identity from the process tree,
// status from the visible screen, git metadata once per distinct cwd.
// Not thread-safe; owned by whichever thread runs the poll.
class PaneEnumerator {
public:
    PaneEnumerator(Multiplexer& mux, ProcessDetector& processes, GitResolver& git,
                   const StatusDetector& detector, EnumeratorOptions options, bool verbose = false);

    // Empty when tmux is unreachable; a stop request abandons the cycle.
    std::vector<TmuxPane> enumerate(std::stop_token stop = {});

    // Delay before the next cycle, stretched exponentially after repeated failures.
    std::chrono::milliseconds next_delay() const;
    int consecutive_failures() const { return failures_; }

private:
    void log(const std::string& msg);

    Multiplexer& mux_;
    ProcessDetector& processes_;
    GitResolver& git_;
    const StatusDetector& detector_;
    EnumeratorOptions options_;
    bool verbose_;

    int failures_ = 0;
    std::unordered_map<std::string, Classification> last_status_;
};
