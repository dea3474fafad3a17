#pragma once

#include <optional>
#include <string>

struct GitInfo {
    std::string repo_root;
    std::string repo_name;
    std::string branch;
};

class GitResolver {
public:
    virtual ~GitResolver() = default;
    // nullopt when `dir` is not inside a work tree.
    virtual std::optional<GitInfo> resolve(const std::string& dir) = 0;
};
