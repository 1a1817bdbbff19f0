#pragma once

#include "core/PodcastFeed.hpp"
#include "core/Subscription.hpp"
#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

namespace podfetch {
namespace core {

struct Episode {
    std::string podcastId;
    std::string sourceUrl;
    std::string filename;      // resolved local filename
    std::string targetPath;    // destination directory + filename
    std::string title;
    std::uint64_t length = 0;
    bool alreadyDownloaded = false;

    // Unique within a podcast; the podcast id scopes it
    const std::string& identityKey() const { return sourceUrl; }
};

struct Reconciliation {
    std::vector<Episode> toDownload;   // feed order, no repeated keys or target paths
    size_t alreadyDone = 0;
    size_t duplicates = 0;
};

// Turns one podcast's feed entries into episodes and splits them into the
// ones still missing and the ones the state store already knows about.
class EpisodeCatalog {
public:
    EpisodeCatalog(const Subscription& subscription, const std::string& destDir);

    Episode makeEpisode(const FeedEntry& entry) const;
    std::string resolveFilename(const std::string& sourceUrl) const;

    // takenNames are filenames already used in the destination, typically those
    // recorded for completed episodes. New episodes never resolve onto them or
    // onto each other; a clash gets a "-2", "-3", ... suffix.
    Reconciliation reconcile(const std::vector<FeedEntry>& entries,
                             const std::unordered_set<std::string>& completed,
                             const std::unordered_set<std::string>& takenNames = {}) const;

    // Last path segment of the URL, without query or fragment, percent-decoded
    static std::string defaultFilename(const std::string& sourceUrl);
    static std::string sanitizeFilename(const std::string& name);
    static std::string percentDecode(const std::string& text);

private:
    Subscription subscription_;
    std::string destDir_;
};

} // namespace core
} // namespace podfetch
