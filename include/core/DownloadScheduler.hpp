#pragma once

#include "core/EpisodeCatalog.hpp"
#include "core/StateStore.hpp"
#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace podfetch {
namespace core {

// Set once from a signal handler or another thread; polled by workers and transfers
class CancellationToken {
public:
    void cancel() { cancelled_ = true; }
    bool isCancelled() const { return cancelled_; }

private:
    std::atomic<bool> cancelled_{false};
};

// Moves one episode to its target path or throws (TransferError on expected failures)
using TransferFn = std::function<void(const Episode&)>;

struct FailedEpisode {
    Episode episode;
    std::string cause;
};

struct DownloadSummary {
    size_t skipped = 0;       // already complete before the run
    size_t downloaded = 0;
    size_t failed = 0;
    size_t cancelled = 0;     // never finished because of a shutdown request
    std::vector<FailedEpisode> failures;
};

// Fixed-size worker pool over one shared queue of episodes.
class DownloadScheduler {
public:
    explicit DownloadScheduler(StateStore& store, const CancellationToken* cancel = nullptr);

    // Blocks until every task has been attempted or the run is cancelled.
    // Throws std::invalid_argument when parallelism < 1.
    DownloadSummary run(const std::vector<Episode>& tasks, int parallelism, const TransferFn& transfer);

private:
    bool cancelled() const { return cancel_ && cancel_->isCancelled(); }

    StateStore& store_;
    const CancellationToken* cancel_;
};

} // namespace core
} // namespace podfetch
