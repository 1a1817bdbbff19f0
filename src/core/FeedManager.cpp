#include "core/FeedManager.hpp"
#include "core/Errors.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace podfetch {
namespace core {

namespace {

nlohmann::json builtinDefaults() {
    return nlohmann::json{
        {"num_parallel_downloads", FeedManager::kDefaultParallelDownloads},
        {"download_limit", 0},
        {"destdir", "~/podfetch/{name}"}
    };
}

} // namespace

FeedManager::FeedManager(const std::string& configDir)
    : configDir_(configDir), defaults_(builtinDefaults()) {}

std::string FeedManager::configPath() const {
    return (fs::path(configDir_) / "podcasts.json").string();
}

std::string FeedManager::stateDir() const {
    return (fs::path(configDir_) / "state").string();
}

bool FeedManager::configExists() const {
    return fs::exists(configPath());
}

void FeedManager::createSample() {
    defaults_ = builtinDefaults();
    subscriptions_.clear();

    Subscription example("example", "https://example.com/podcast/sample.rss?foo=1&bar=2");
    example.destDir = "/path/to/podcasts/dir";
    example.sedRule = "s/a/b/";
    example.downloadLimit = 10;
    example.compileRule();
    subscriptions_.push_back(example);

    spdlog::debug("generating sample config {}", configPath());
    save();
}

bool FeedManager::onlyExample() const {
    return subscriptions_.size() == 1 && subscriptions_.front().name == "example";
}

void FeedManager::load() {
    std::ifstream file(configPath());
    if (!file.is_open()) {
        throw ConfigError("Could not open configuration file: " + configPath());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Could not parse " + configPath() + ": " + e.what());
    }

    if (!j.is_object()) {
        throw ConfigError(configPath() + ": expected a JSON object");
    }

    defaults_ = builtinDefaults();
    if (j.contains("defaults")) {
        if (!j["defaults"].is_object()) {
            throw ConfigError(configPath() + ": \"defaults\" must be an object");
        }
        defaults_.update(j["defaults"]);
    }

    subscriptions_.clear();
    if (j.contains("podcasts") && j["podcasts"].is_array()) {
        for (const auto& subJson : j["podcasts"]) {
            try {
                Subscription sub = Subscription::fromJson(subJson, defaults_);
                if (findSubscriptionIndex(sub.name) != -1) {
                    spdlog::error("{}: podcast '{}' is listed twice, keeping the first", configPath(), sub.name);
                    continue;
                }
                if (!sub.hasValidRule()) {
                    spdlog::error("{}: {}", sub.name, sub.ruleError);
                }
                subscriptions_.push_back(std::move(sub));
            } catch (const nlohmann::json::exception& e) {
                spdlog::error("{}: skipping podcast entry: {}", configPath(), e.what());
            }
        }
    }

    spdlog::debug("config podcasts: {}", subscriptions_.size());
}

void FeedManager::save() {
    nlohmann::json j;
    j["defaults"] = defaults_;
    j["podcasts"] = nlohmann::json::array();
    for (const auto& sub : subscriptions_) {
        j["podcasts"].push_back(sub.toJson());
    }

    std::error_code ec;
    fs::create_directories(configDir_, ec);
    if (ec) {
        throw ConfigError("Could not create " + configDir_ + ": " + ec.message());
    }

    const fs::path finalPath = configPath();
    fs::path tempPath = finalPath;
    tempPath += ".tmp";
    {
        std::ofstream file(tempPath);
        if (!file.is_open()) {
            throw ConfigError("Could not open file for writing: " + tempPath.string());
        }
        file << j.dump(4) << "\n";
        file.flush();
        if (file.fail()) {
            fs::remove(tempPath, ec);
            throw ConfigError("Could not write " + tempPath.string());
        }
    }

    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        throw ConfigError("Could not replace " + finalPath.string() + ": " + ec.message());
    }
}

bool FeedManager::addPodcast(const std::string& name, const std::string& feedUrl, const std::string& sedRule) {
    if (name.empty() || feedUrl.empty()) {
        return false;
    }

    for (const auto& sub : subscriptions_) {
        if (sub.feedUrl == feedUrl || sub.name == name) {
            spdlog::warn("Podcast with this name or URL already exists: {}", sub.name);
            return false;
        }
    }

    Subscription newSub(name, feedUrl, sedRule);
    if (!sedRule.empty()) {
        newSub.rule = SubstitutionRule::parse(sedRule);
    }
    subscriptions_.push_back(newSub);

    save();
    return true;
}

bool FeedManager::removePodcast(const std::string& name) {
    int index = findSubscriptionIndex(name);
    if (index == -1) {
        return false;
    }

    subscriptions_.erase(subscriptions_.begin() + index);
    save();
    return true;
}

std::optional<Subscription> FeedManager::findPodcast(const std::string& name) const {
    int index = findSubscriptionIndex(name);
    if (index == -1) {
        return std::nullopt;
    }
    return subscriptions_[index];
}

int FeedManager::parallelDownloads() const {
    int n = defaults_.value("num_parallel_downloads", kDefaultParallelDownloads);
    return n > 0 ? n : kDefaultParallelDownloads;
}

int FeedManager::findSubscriptionIndex(const std::string& name) const {
    for (size_t i = 0; i < subscriptions_.size(); ++i) {
        if (subscriptions_[i].name == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

} // namespace core
} // namespace podfetch
