#pragma once

#include <string>

struct DetectionResult {
    std::string agent;
    std::string process;
    int pid = 0;
};

class ProcessDetector {
public:
    virtual ~ProcessDetector() = default;
    // Takes a fresh process-table snapshot; detect() answers from it.
    virtual void refresh() = 0;
    // Searches `pid` and its descendants for a known agent process.
    virtual DetectionResult detect(int pid) const = 0;
};
