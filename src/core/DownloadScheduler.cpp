#include "core/DownloadScheduler.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <spdlog/spdlog.h>

namespace podfetch {
namespace core {

DownloadScheduler::DownloadScheduler(StateStore& store, const CancellationToken* cancel)
    : store_(store), cancel_(cancel) {}

DownloadSummary DownloadScheduler::run(const std::vector<Episode>& tasks, int parallelism,
                                       const TransferFn& transfer) {
    if (parallelism < 1) {
        throw std::invalid_argument("parallelism must be at least 1");
    }

    DownloadSummary summary;
    if (tasks.empty()) {
        return summary;
    }

    std::deque<const Episode*> queue;
    for (const auto& task : tasks) {
        queue.push_back(&task);
    }
    std::mutex queue_mtx;
    std::mutex summary_mtx;

    auto recordFailure = [&](const Episode& episode, const std::string& cause) {
        std::lock_guard<std::mutex> lk(summary_mtx);
        ++summary.failed;
        summary.failures.push_back(FailedEpisode{episode, cause});
    };

    auto worker = [&]() {
        for (;;) {
            const Episode* task = nullptr;
            {
                std::lock_guard<std::mutex> lk(queue_mtx);
                if (queue.empty() || cancelled()) {
                    return;
                }
                task = queue.front();
                queue.pop_front();
            }

            spdlog::debug("{}: fetching {}", task->podcastId, task->sourceUrl);
            try {
                transfer(*task);
            } catch (const TransferCancelledError&) {
                std::lock_guard<std::mutex> lk(summary_mtx);
                ++summary.cancelled;
                continue;
            } catch (const std::exception& e) {
                spdlog::warn("{}: {} failed: {}", task->podcastId, task->sourceUrl, e.what());
                recordFailure(*task, e.what());
                continue;
            }

            // The file is in place; only now may the episode count as done
            try {
                store_.markComplete(task->podcastId, task->identityKey(), task->filename);
            } catch (const std::exception& e) {
                spdlog::error("{}: downloaded {} but could not record it, it will be fetched again: {}",
                              task->podcastId, task->filename, e.what());
                recordFailure(*task, std::string("state not saved: ") + e.what());
                continue;
            }

            spdlog::info("{}: downloaded {}", task->podcastId, task->filename);
            std::lock_guard<std::mutex> lk(summary_mtx);
            ++summary.downloaded;
        }
    };

    int threads = std::min(parallelism, static_cast<int>(tasks.size()));
    std::vector<std::thread> workers;
    workers.reserve(threads);
    for (int i = 0; i < threads; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    // Whatever is left in the queue was never started
    summary.cancelled += queue.size();
    return summary;
}

} // namespace core
} // namespace podfetch
