#pragma once

#include "platform/git_resolver.hpp"

#include <optional>
#include <string>
#include <vector>

class GitCliResolver : public GitResolver {
public:
    explicit GitCliResolver(int timeout_ms = 2000);

    std::optional<GitInfo> resolve(const std::string& dir) override;

    // "https://host/org/name.git", "git@host:org/name.git" -> "name"
    static std::string repo_name_from_remote(const std::string& url);

private:
    std::optional<std::string> git(const std::string& dir, std::vector<std::string> args);

    int timeout_ms_;
};
