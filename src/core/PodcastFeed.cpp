#include "core/PodcastFeed.hpp"
#include "core/Errors.hpp"
#include <chrono>
#include <sstream>
#include <algorithm>
#include <cpr/cpr.h>
#include <pugixml.hpp>
#include <ada.h>
#include <spdlog/spdlog.h>

namespace podfetch {
namespace core {

std::string PodcastFeed::cleanAndValidateUrl(const std::string& url) {
    if (url.empty()) {
        return "";
    }

    // Trim whitespace
    std::string cleaned = url;
    cleaned.erase(0, cleaned.find_first_not_of(" \t\n\r"));
    cleaned.erase(cleaned.find_last_not_of(" \t\n\r") + 1);

    if (cleaned.empty()) {
        return "";
    }

    auto parsed_url = ada::parse<ada::url>(cleaned);
    if (!parsed_url) {
        return "";
    }

    if (parsed_url->get_protocol() != "http:" && parsed_url->get_protocol() != "https:") {
        return "";
    }

    return parsed_url->get_href();
}

void PodcastFeed::loadFromUrl(const std::string& url, long timeoutMs) {
    if (url.empty()) {
        throw FeedFetchError("Empty feed URL");
    }

    auto response = cpr::Get(
        cpr::Url{url},
        cpr::Header{
            {"User-Agent", "Mozilla/5.0 (compatible; podfetch/1.0)"},
            {"Accept", "application/rss+xml, application/xml, text/xml"}
        },
        cpr::Timeout{std::chrono::milliseconds(timeoutMs)},
        cpr::Redirect{50L},
        cpr::VerifySsl{true}
    );

    if (response.error.code != cpr::ErrorCode::OK) {
        throw FeedFetchError("Failed to fetch feed " + url + ": " + response.error.message);
    }

    if (response.status_code < 200 || response.status_code >= 300) {
        std::stringstream err;
        err << "Failed to fetch feed " << url << ": HTTP " << response.status_code;
        throw FeedFetchError(err.str());
    }

    if (response.text.empty()) {
        throw FeedFetchError("Empty response received from " + url);
    }

    auto content_type_it = response.header.find("content-type");
    if (content_type_it != response.header.end()) {
        std::string type = content_type_it->second;
        std::transform(type.begin(), type.end(), type.begin(), ::tolower);
        if (type.find("xml") == std::string::npos &&
            type.find("rss") == std::string::npos &&
            type.find("atom") == std::string::npos) {
            spdlog::warn("{}: unexpected content type {}", url, type);
        }
    }

    loadFromString(response.text);
}

std::string PodcastFeed::extractMediaUrl(const pugi::xml_node& item) const {
    auto enclosure = item.child("enclosure");
    if (enclosure) {
        std::string url = cleanAndValidateUrl(enclosure.attribute("url").value());
        if (!url.empty()) {
            return url;
        }
    }

    for (auto media_content : item.children("media:content")) {
        std::string type = media_content.attribute("type").value();
        if (type.find("audio/") == 0 || type.find("video/") == 0 ||
            type.find("application/octet-stream") == 0) {
            std::string url = cleanAndValidateUrl(media_content.attribute("url").value());
            if (!url.empty()) {
                return url;
            }
        }
    }

    return "";
}

void PodcastFeed::loadFromString(const std::string& xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_string(xml.c_str());
    if (!result) {
        throw FeedFetchError("Failed to parse XML feed: " + std::string(result.description()));
    }

    entries_.clear();
    title_.clear();
    link_.clear();

    pugi::xml_node channel = doc.child("rss").child("channel");
    if (!channel) {
        throw FeedFetchError("Invalid podcast feed format: no rss channel element found");
    }

    if (auto title = channel.child("title")) {
        title_ = title.text().get();
    }

    if (auto link = channel.child("link")) {
        link_ = link.text().get();
    }

    size_t skipped = 0;
    for (auto item : channel.children("item")) {
        FeedEntry entry;
        entry.url = extractMediaUrl(item);
        if (entry.url.empty()) {
            ++skipped;
            continue;
        }

        if (auto title = item.child("title")) {
            entry.title = title.text().get();
        }

        if (auto pubDate = item.child("pubDate")) {
            entry.pubDate = pubDate.text().get();
        }

        if (auto guid = item.child("guid")) {
            entry.guid = guid.text().get();
        }

        entry.length = item.child("enclosure").attribute("length").as_ullong(0);
        entries_.push_back(entry);
    }

    if (skipped > 0) {
        spdlog::debug("{}: {} items without a media URL", title_, skipped);
    }
}

std::vector<FeedEntry> HttpFeedSource::fetch(const Subscription& subscription) {
    PodcastFeed feed;
    feed.loadFromUrl(subscription.feedUrl, timeoutMs_);
    spdlog::info("{}: {} items", subscription.name, feed.getEntries().size());
    return feed.getEntries();
}

} // namespace core
} // namespace podfetch
