#pragma once

#include "core/Subscription.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <pugixml.hpp>

namespace podfetch {
namespace core {

// One <item> of a feed that carries a downloadable media URL
struct FeedEntry {
    std::string title;
    std::string url;
    std::string pubDate;
    std::string guid;
    std::uint64_t length = 0;   // enclosure length in bytes, 0 when the feed omits it
};

class PodcastFeed {
public:
    PodcastFeed() = default;
    ~PodcastFeed() = default;

    // Fetch and parse a feed. Throws FeedFetchError.
    void loadFromUrl(const std::string& url, long timeoutMs = 30000);

    // Parse an already fetched document. Throws FeedFetchError.
    void loadFromString(const std::string& xml);

    // Entries in the order the feed lists them
    const std::vector<FeedEntry>& getEntries() const { return entries_; }

    std::string getTitle() const { return title_; }
    std::string getLink() const { return link_; }

    // Trimmed absolute http(s) URL, or "" when the input is not one
    static std::string cleanAndValidateUrl(const std::string& url);

private:
    std::string extractMediaUrl(const pugi::xml_node& item) const;

    std::string title_;
    std::string link_;
    std::vector<FeedEntry> entries_;
};

// Where the orchestrator gets episode lists from
class FeedSource {
public:
    virtual ~FeedSource() = default;

    // Throws FeedFetchError
    virtual std::vector<FeedEntry> fetch(const Subscription& subscription) = 0;
};

class HttpFeedSource : public FeedSource {
public:
    explicit HttpFeedSource(long timeoutMs = 30000) : timeoutMs_(timeoutMs) {}

    std::vector<FeedEntry> fetch(const Subscription& subscription) override;

private:
    long timeoutMs_;
};

} // namespace core
} // namespace podfetch
