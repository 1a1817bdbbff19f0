#pragma once

#include "core/Subscription.hpp"
#include <vector>
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace podfetch {
namespace core {

// The podcast list and run defaults, kept in <configDir>/podcasts.json
class FeedManager {
public:
    explicit FeedManager(const std::string& configDir);

    // Throws ConfigError when the file cannot be read or parsed
    void load();
    // Throws ConfigError
    void save();

    bool configExists() const;
    // Writes an example configuration for the operator to edit. Throws ConfigError.
    void createSample();
    // True when the only podcast configured is the untouched example
    bool onlyExample() const;

    // Subscription management. addPodcast throws MalformedRuleError for a bad rule.
    bool addPodcast(const std::string& name, const std::string& feedUrl, const std::string& sedRule = "");
    bool removePodcast(const std::string& name);
    const std::vector<Subscription>& getSubscriptions() const { return subscriptions_; }
    std::optional<Subscription> findPodcast(const std::string& name) const;

    int parallelDownloads() const;

    std::string configPath() const;
    std::string stateDir() const;
    const std::string& configDir() const { return configDir_; }

    static constexpr int kDefaultParallelDownloads = 4;

private:
    int findSubscriptionIndex(const std::string& name) const;

    std::string configDir_;
    nlohmann::json defaults_;
    std::vector<Subscription> subscriptions_;
};

} // namespace core
} // namespace podfetch
