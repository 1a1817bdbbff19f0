#include "core/EpisodeCatalog.hpp"
#include <filesystem>
#include <ada.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace podfetch {
namespace core {

namespace {

// "name.ext" -> "name-2.ext", "name-3.ext", ... until one is free
std::string uniqueFilename(const std::string& name, const std::unordered_set<std::string>& taken) {
    if (!taken.count(name)) {
        return name;
    }
    const fs::path path(name);
    const std::string stem = path.stem().string();
    const std::string extension = path.extension().string();
    for (int n = 2;; ++n) {
        std::string candidate = stem + "-" + std::to_string(n) + extension;
        if (!taken.count(candidate)) {
            return candidate;
        }
    }
}

} // namespace

EpisodeCatalog::EpisodeCatalog(const Subscription& subscription, const std::string& destDir)
    : subscription_(subscription), destDir_(destDir) {}

std::string EpisodeCatalog::percentDecode(const std::string& text) {
    return ada::unicode::percent_decode(text, text.find('%'));
}

std::string EpisodeCatalog::sanitizeFilename(const std::string& name) {
    std::string s = name;
    for (char& c : s) {
        if (c == '/' || c == '\\' || c == ':' || c == '*' || c == '?' || c == '"' ||
            c == '<' || c == '>' || c == '|' || static_cast<unsigned char>(c) < 0x20) {
            c = '_';
        }
    }
    return s;
}

std::string EpisodeCatalog::defaultFilename(const std::string& sourceUrl) {
    std::string path;
    auto parsed_url = ada::parse<ada::url>(sourceUrl);
    if (parsed_url) {
        path = std::string(parsed_url->get_pathname());
    } else {
        path = sourceUrl.substr(0, sourceUrl.find_first_of("?#"));
    }

    auto slash = path.find_last_of('/');
    std::string segment = (slash == std::string::npos) ? path : path.substr(slash + 1);
    return sanitizeFilename(percentDecode(segment));
}

std::string EpisodeCatalog::resolveFilename(const std::string& sourceUrl) const {
    if (subscription_.rule && subscription_.rule->matches(sourceUrl)) {
        std::string name = sanitizeFilename(subscription_.rule->apply(sourceUrl));
        if (!name.empty() && name != "." && name != "..") {
            return name;
        }
        spdlog::warn("{}: rule produced no usable filename for {}", subscription_.name, sourceUrl);
    }

    std::string name = defaultFilename(sourceUrl);
    if (name.empty() || name == "." || name == "..") {
        // URLs ending in '/' have no last segment to use
        name = sanitizeFilename(sourceUrl);
    }
    return name;
}

Episode EpisodeCatalog::makeEpisode(const FeedEntry& entry) const {
    Episode episode;
    episode.podcastId = subscription_.name;
    episode.sourceUrl = entry.url;
    episode.filename = resolveFilename(entry.url);
    episode.targetPath = (fs::path(destDir_) / episode.filename).string();
    episode.title = entry.title;
    episode.length = entry.length;
    return episode;
}

Reconciliation EpisodeCatalog::reconcile(const std::vector<FeedEntry>& entries,
                                         const std::unordered_set<std::string>& completed,
                                         const std::unordered_set<std::string>& takenNames) const {
    Reconciliation result;
    std::unordered_set<std::string> seen;
    std::unordered_set<std::string> reserved = takenNames;
    std::vector<const FeedEntry*> pending;

    size_t considered = entries.size();
    if (subscription_.downloadLimit > 0 && static_cast<size_t>(subscription_.downloadLimit) < considered) {
        considered = static_cast<size_t>(subscription_.downloadLimit);
    }

    for (size_t i = 0; i < considered; ++i) {
        const FeedEntry& entry = entries[i];
        if (entry.url.empty()) {
            continue;
        }
        if (!seen.insert(entry.url).second) {
            ++result.duplicates;
            continue;
        }

        if (completed.count(entry.url)) {
            ++result.alreadyDone;
            reserved.insert(resolveFilename(entry.url));
            continue;
        }
        pending.push_back(&entry);
    }

    // Files of completed episodes keep their names; new episodes give way
    for (const FeedEntry* entry : pending) {
        Episode episode = makeEpisode(*entry);
        std::string name = uniqueFilename(episode.filename, reserved);
        if (name != episode.filename) {
            spdlog::info("{}: {} is taken, saving {} as {}", subscription_.name, episode.filename,
                         episode.sourceUrl, name);
            episode.filename = name;
            episode.targetPath = (fs::path(destDir_) / name).string();
        }
        reserved.insert(name);

        spdlog::debug("{}: {} -> {}", subscription_.name, episode.sourceUrl, episode.targetPath);
        result.toDownload.push_back(std::move(episode));
    }

    return result;
}

} // namespace core
} // namespace podfetch
