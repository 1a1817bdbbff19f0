#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace podfetch {
namespace core {

struct CompletionRecord {
    std::string key;
    std::string filename;
    std::chrono::system_clock::time_point completedAt;
};

// Durable per-podcast record of completed episodes.
//
// Each podcast gets one JSON-lines file under the state directory. Records are
// only ever appended; loading folds repeated keys so the last one wins.
class StateStore {
public:
    explicit StateStore(const std::string& directory);

    // Keys already marked complete for the podcast
    std::unordered_set<std::string> load(const std::string& podcastId) const;

    // Full records, last write per key
    std::unordered_map<std::string, CompletionRecord> records(const std::string& podcastId) const;

    // Appends a completion record. Safe to call from several workers at once.
    // Throws StateWriteError.
    void markComplete(const std::string& podcastId, const std::string& identityKey,
                      const std::string& resolvedFilename);

    std::string pathFor(const std::string& podcastId) const;
    const std::string& directory() const { return directory_; }

private:
    std::string directory_;
    mutable std::mutex writeMutex_;
};

} // namespace core
} // namespace podfetch
