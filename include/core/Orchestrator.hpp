#pragma once

#include "core/DownloadScheduler.hpp"
#include "core/EpisodeCatalog.hpp"
#include "core/PodcastFeed.hpp"
#include "core/StateStore.hpp"
#include "core/Subscription.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace podfetch {
namespace core {

enum class RunMode {
    Full,
    RefreshOnly
};

struct PodcastReport {
    enum class Status {
        Ok,
        Disabled,
        ConfigError,
        FetchError,
        DryRun,
        Cancelled
    };

    std::string name;
    Status status = Status::Ok;
    std::string error;
    size_t discovered = 0;          // episodes not yet downloaded
    bool downloadsStarted = false;  // the scheduler was handed the new episodes
    std::vector<Episode> pending;   // listed for refresh-only and dry runs
    DownloadSummary summary;
};

struct RunReport {
    std::vector<PodcastReport> podcasts;

    size_t totalDiscovered() const;
    size_t totalDownloaded() const;
    size_t totalFailed() const;
    bool hasFailures() const;
    bool wasCancelled() const;

    // 0 on a clean run, 1 when a podcast or an episode failed, 2 when interrupted
    int exitCode() const;

    void print(std::ostream& out, bool verbose) const;
};

// Runs every configured podcast once: fetch, reconcile, download.
class Orchestrator {
public:
    Orchestrator(FeedSource& feeds, StateStore& store, TransferFn transfer,
                 int parallelism, const CancellationToken* cancel = nullptr);

    RunReport runOnce(const std::vector<Subscription>& podcasts, RunMode mode);

private:
    PodcastReport processPodcast(const Subscription& podcast, RunMode mode);

    FeedSource& feeds_;
    StateStore& store_;
    TransferFn transfer_;
    int parallelism_;
    const CancellationToken* cancel_;
};

const char* statusName(PodcastReport::Status status);

} // namespace core
} // namespace podfetch
