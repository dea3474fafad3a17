#include "detector/rule_table.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

using json = nlohmann::json;

namespace {

constexpr const char* kDefaultRules = R"json({
  "version": 3,
  "reason_aliases": {
    "ask": "respond",
    "approve": "respond",
    "permission": "respond",
    "question": "respond",
    "plan": "respond",
    "select": "respond"
  },
  "agents": {
    "claude": {
      "prompt_glyphs": ["❯", ">"],
      "spinner_glyphs": ["✢", "✽", "✶", "✳", "✻", "·", "*"],
      "spinner_requires": ["…", "esc to interrupt"],
      "running_patterns": ["esc to interrupt", "\\(running\\)$"],
      "waiting_patterns": [
        {"pattern": "Enter to select", "reason": "question"},
        {"pattern": "Do you want to (proceed|make this edit|create|allow|run)", "reason": "permission"},
        {"pattern": "^❯ ?[0-9]+\\. ", "reason": "plan", "unless_prompt": true}
      ],
      "skip_patterns": [
        "^⏵",
        "^⏸",
        "ctrl[+-]",
        "Context left until auto-compact",
        "for shortcuts",
        "shift\\+tab to cycle",
        "^[0-9].*(file.*[+-]|[+-].*file)",
        "^[0-9]+\\. ",
        "Enter to select",
        "(plan mode|bypass permissions|accept edits) on"
      ],
      "mode_patterns": [
        {"pattern": "plan mode on", "mode": "plan"},
        {"pattern": "bypass permissions on", "mode": "bypass"},
        {"pattern": "accept edits on", "mode": "accept"}
      ]
    },
    "codex": {
      "prompt_glyphs": ["›"],
      "running_patterns": ["s • esc to interrupt"],
      "waiting_patterns": [
        {"pattern": "enter to submit answer", "reason": "question"},
        {"pattern": "enter to confirm", "reason": "approve"},
        {"pattern": "Would you like to run the following command\\?", "reason": "permission"},
        {"pattern": "Allow command\\?", "reason": "permission"}
      ],
      "skip_patterns": [
        "for shortcuts",
        "context left",
        "background terminal running",
        "/ps to view",
        "/clean to close"
      ]
    },
    "opencode": {
      "running_patterns": ["esc interrupt", "esc again to interrupt"],
      "waiting_patterns": [
        {"pattern": "select.*enter submit.*esc dismiss", "reason": "select"},
        {"pattern": "Permission Required", "reason": "permission"},
        {"pattern": "Allow \\(a\\)", "reason": "permission"}
      ],
      "mode_patterns": [
        {"pattern": "^▣ +Plan", "mode": "plan"},
        {"pattern": "^▣ +Build", "mode": "build"}
      ],
      "quiet_status": "idle"
    }
  }
})json";

std::regex compile(const std::string& pattern) {
    return std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
}

std::vector<std::string> string_list(const json& j, const char* key) {
    if (!j.contains(key)) return {};
    return j[key].get<std::vector<std::string>>();
}

RuleTable parse_table(AgentType agent, const json& j,
                      const std::unordered_map<std::string, std::string>& aliases) {
    RuleTable t;
    t.agent = agent;
    t.prompt_glyphs = string_list(j, "prompt_glyphs");
    t.spinner_glyphs = string_list(j, "spinner_glyphs");
    t.spinner_requires = string_list(j, "spinner_requires");

    for (auto& p : string_list(j, "running_patterns")) t.running_patterns.push_back(compile(p));
    for (auto& p : string_list(j, "skip_patterns")) t.skip_patterns.push_back(compile(p));

    if (j.contains("waiting_patterns")) {
        for (auto& w : j["waiting_patterns"]) {
            WaitingPattern wp;
            wp.source = w.at("pattern").get<std::string>();
            wp.regex = compile(wp.source);
            wp.reason = w.value("reason", "respond");
            if (auto it = aliases.find(wp.reason); it != aliases.end()) wp.reason = it->second;
            if (wp.reason.empty()) wp.reason = "respond";
            wp.unless_prompt = w.value("unless_prompt", false);
            t.waiting_patterns.push_back(std::move(wp));
        }
    }

    if (j.contains("mode_patterns")) {
        for (auto& m : j["mode_patterns"]) {
            t.mode_patterns.push_back({compile(m.at("pattern").get<std::string>()),
                                       m.at("mode").get<std::string>()});
        }
    }

    if (j.contains("quiet_status")) {
        auto status = agent_status_from_string(j["quiet_status"].get<std::string>());
        if (!status || *status == AgentStatus::Waiting) {
            throw std::invalid_argument("quiet_status must be running or idle");
        }
        t.quiet_status = status;
    }

    t.scan_lines = j.value("scan_lines", 30);
    t.max_unknown_lines = j.value("max_unknown_lines", 3);
    return t;
}

} // namespace

RuleSet RuleSet::defaults() {
    auto rules = parse(kDefaultRules);
    // The built-in table is a constant; failing to parse it is a programming error.
    if (!rules) throw std::logic_error("built-in rule table: " + rules.error());
    return std::move(*rules);
}

std::expected<RuleSet, std::string> RuleSet::parse(const std::string& json_text) {
    RuleSet set;
    try {
        auto j = json::parse(json_text);
        set.version_ = j.value("version", 0);

        std::unordered_map<std::string, std::string> aliases;
        if (j.contains("reason_aliases")) {
            aliases = j["reason_aliases"].get<std::unordered_map<std::string, std::string>>();
        }

        if (!j.contains("agents") || !j["agents"].is_object()) {
            return std::unexpected("rules: missing agents object");
        }

        for (auto& [name, body] : j["agents"].items()) {
            auto agent = agent_type_from_string(name);
            if (!agent) return std::unexpected("rules: unknown agent '" + name + "'");
            set.tables_.push_back(parse_table(*agent, body, aliases));
        }
    } catch (const json::exception& e) {
        return std::unexpected(std::string("rules: parse error: ") + e.what());
    } catch (const std::regex_error& e) {
        return std::unexpected(std::string("rules: invalid pattern: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return std::unexpected(std::string("rules: ") + e.what());
    }
    return set;
}

std::expected<RuleSet, std::string> RuleSet::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) return std::unexpected("rules: could not open " + path);
    std::stringstream ss;
    ss << f.rdbuf();
    return parse(ss.str());
}

const RuleTable* RuleSet::table(AgentType agent) const {
    for (auto& t : tables_) {
        if (t.agent == agent) return &t;
    }
    return nullptr;
}
