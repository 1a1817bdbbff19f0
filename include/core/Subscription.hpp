#pragma once

#include "core/SubstitutionRule.hpp"
#include <cstdlib>
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace podfetch {
namespace core {

struct Subscription {
    std::string name;          // podcast identifier, also names the state file
    std::string feedUrl;
    std::string description;
    std::string destDir;       // as written in the config, before expansion
    std::string sedRule;       // empty = default basename
    bool enabled;
    bool dryRun;
    int downloadLimit;         // 0 = every entry in the feed

    // Filled in when the subscription is loaded
    std::optional<SubstitutionRule> rule;
    std::string ruleError;

    Subscription() : enabled(true), dryRun(false), downloadLimit(0) {}

    Subscription(const std::string& name, const std::string& feedUrl, const std::string& sedRule = "")
        : name(name), feedUrl(feedUrl), sedRule(sedRule), enabled(true), dryRun(false), downloadLimit(0) {}

    // Parses sedRule into rule, recording the failure in ruleError instead of throwing
    void compileRule() {
        rule.reset();
        ruleError.clear();
        if (sedRule.empty()) {
            return;
        }
        try {
            rule = SubstitutionRule::parse(sedRule);
        } catch (const MalformedRuleError& e) {
            ruleError = e.what();
        }
    }

    bool hasValidRule() const { return ruleError.empty(); }

    // destDir with "{name}" replaced and a leading "~" expanded to $HOME
    std::string destinationDir() const {
        std::string dir = destDir.empty() ? name : destDir;
        const std::string placeholder = "{name}";
        for (auto pos = dir.find(placeholder); pos != std::string::npos; pos = dir.find(placeholder, pos + name.size())) {
            dir.replace(pos, placeholder.size(), name);
        }
        if (!dir.empty() && dir[0] == '~' && (dir.size() == 1 || dir[1] == '/')) {
            const char* home = std::getenv("HOME");
            if (home) {
                dir.replace(0, 1, home);
            }
        }
        return dir;
    }

    // JSON serialization; only fields that differ from the defaults are written
    nlohmann::json toJson() const {
        nlohmann::json j{
            {"name", name},
            {"url", feedUrl}
        };
        if (!description.empty()) j["description"] = description;
        if (!destDir.empty()) j["destdir"] = destDir;
        if (!sedRule.empty()) j["sed"] = sedRule;
        if (!enabled) j["enabled"] = false;
        if (dryRun) j["dry_run"] = true;
        if (downloadLimit > 0) j["download_limit"] = downloadLimit;
        return j;
    }

    // JSON deserialization; absent fields fall back to the "defaults" object
    static Subscription fromJson(const nlohmann::json& j, const nlohmann::json& defaults = nlohmann::json::object()) {
        Subscription sub;
        sub.name = j.at("name").get<std::string>();
        sub.feedUrl = j.at("url").get<std::string>();
        sub.description = j.value("description", std::string());
        sub.destDir = j.value("destdir", defaults.value("destdir", std::string()));
        sub.sedRule = j.value("sed", defaults.value("sed", std::string()));
        sub.enabled = j.value("enabled", defaults.value("enabled", true));
        sub.dryRun = j.value("dry_run", defaults.value("dry_run", false));
        sub.downloadLimit = j.value("download_limit", defaults.value("download_limit", 0));
        sub.compileRule();
        return sub;
    }

    bool operator==(const Subscription& other) const {
        return name == other.name;
    }
};

} // namespace core
} // namespace podfetch
