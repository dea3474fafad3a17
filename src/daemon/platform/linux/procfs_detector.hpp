#pragma once

#include "platform/process_detector.hpp"

#include <string>
#include <unordered_map>
#include <vector>

struct AgentProcess {
    std::string process;
    std::string agent;
};

class ProcfsDetector : public ProcessDetector {
public:
    explicit ProcfsDetector(std::vector<AgentProcess> known_agents, std::string proc_root = "/proc");

    void refresh() override;
    DetectionResult detect(int pid) const override;

    size_t process_count() const { return comm_.size(); }

private:
    const AgentProcess* match(const std::string& comm) const;

    std::vector<AgentProcess> known_agents_;
    std::string proc_root_;

    std::unordered_map<int, std::string> comm_;
    std::unordered_map<int, std::vector<int>> children_;
};
