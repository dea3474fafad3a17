#include "platform/linux/procfs_detector.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

struct StatLine {
    int pid = 0;
    int ppid = 0;
    std::string comm;
};

// "/proc/<pid>/stat": pid (comm) state ppid ...; comm may contain spaces and parens.
bool parse_stat(const std::string& line, StatLine& out) {
    auto open = line.find('(');
    auto close = line.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) return false;

    std::istringstream head(line.substr(0, open));
    if (!(head >> out.pid)) return false;
    out.comm = line.substr(open + 1, close - open - 1);

    std::istringstream rest(line.substr(close + 1));
    std::string state;
    return static_cast<bool>(rest >> state >> out.ppid);
}

} // namespace

ProcfsDetector::ProcfsDetector(std::vector<AgentProcess> known_agents, std::string proc_root)
    : known_agents_(std::move(known_agents)), proc_root_(std::move(proc_root)) {}

void ProcfsDetector::refresh() {
    comm_.clear();
    children_.clear();

    std::error_code ec;
    for (auto& entry : fs::directory_iterator(proc_root_, ec)) {
        auto name = entry.path().filename().string();
        if (name.empty() || !std::ranges::all_of(name, [](char c) { return c >= '0' && c <= '9'; })) continue;

        std::ifstream f(entry.path() / "stat");
        if (!f.is_open()) continue;
        std::string line;
        std::getline(f, line);

        StatLine st;
        if (!parse_stat(line, st)) continue;
        comm_[st.pid] = st.comm;
        children_[st.ppid].push_back(st.pid);
    }
}

const AgentProcess* ProcfsDetector::match(const std::string& comm) const {
    auto base = fs::path(comm).filename().string();
    for (auto& a : known_agents_) {
        if (base == a.process) return &a;
    }
    return nullptr;
}

DetectionResult ProcfsDetector::detect(int pid) const {
    if (pid <= 0) return {};

    // Depth-first, the pane process itself included.
    std::vector<int> stack = {pid};
    std::vector<int> seen;
    while (!stack.empty()) {
        int current = stack.back();
        stack.pop_back();
        if (std::ranges::find(seen, current) != seen.end()) continue;
        seen.push_back(current);

        if (auto it = comm_.find(current); it != comm_.end()) {
            if (auto* agent = match(it->second)) {
                return {agent->agent, agent->process, current};
            }
        }

        if (auto it = children_.find(current); it != children_.end()) {
            for (auto child = it->second.rbegin(); child != it->second.rend(); ++child) {
                stack.push_back(*child);
            }
        }
    }
    return {};
}
