#include "platform/linux/git_cli_resolver.hpp"

#include "detector/screen_text.hpp"
#include "platform/command_runner.hpp"

#include <filesystem>
#include <vector>

GitCliResolver::GitCliResolver(int timeout_ms)
    : timeout_ms_(timeout_ms) {}

std::optional<std::string> GitCliResolver::git(const std::string& dir, std::vector<std::string> args) {
    std::vector<std::string> argv = {"git", "-C", dir};
    argv.insert(argv.end(), args.begin(), args.end());
    auto res = platform::run_command(argv, timeout_ms_);
    if (!res || res->exit_code != 0) return std::nullopt;
    auto out = screen::trim(res->output);
    if (out.empty()) return std::nullopt;
    return out;
}

std::optional<GitInfo> GitCliResolver::resolve(const std::string& dir) {
    if (dir.empty()) return std::nullopt;

    auto root = git(dir, {"rev-parse", "--show-toplevel"});
    if (!root) return std::nullopt;

    GitInfo info;
    info.repo_root = *root;

    if (auto remote = git(dir, {"remote", "get-url", "origin"})) {
        info.repo_name = repo_name_from_remote(*remote);
    }
    if (info.repo_name.empty()) {
        info.repo_name = std::filesystem::path(info.repo_root).filename().string();
    }

    if (auto branch = git(dir, {"branch", "--show-current"})) {
        info.branch = *branch;
    }
    return info;
}

std::string GitCliResolver::repo_name_from_remote(const std::string& url) {
    std::string s = screen::trim(url);
    while (!s.empty() && s.back() == '/') s.pop_back();
    if (s.ends_with(".git")) s.resize(s.size() - 4);

    auto pos = s.find_last_of("/:");
    if (pos != std::string::npos) s = s.substr(pos + 1);
    return s;
}
