#include "core/Orchestrator.hpp"
#include "core/Errors.hpp"
#include <iomanip>
#include <stdexcept>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace podfetch {
namespace core {

const char* statusName(PodcastReport::Status status) {
    switch (status) {
        case PodcastReport::Status::Ok: return "ok";
        case PodcastReport::Status::Disabled: return "disabled";
        case PodcastReport::Status::ConfigError: return "configuration error";
        case PodcastReport::Status::FetchError: return "feed error";
        case PodcastReport::Status::DryRun: return "dry run";
        case PodcastReport::Status::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

Orchestrator::Orchestrator(FeedSource& feeds, StateStore& store, TransferFn transfer,
                           int parallelism, const CancellationToken* cancel)
    : feeds_(feeds), store_(store), transfer_(std::move(transfer)),
      parallelism_(parallelism), cancel_(cancel) {
    if (parallelism_ < 1) {
        throw std::invalid_argument("parallelism must be at least 1");
    }
}

RunReport Orchestrator::runOnce(const std::vector<Subscription>& podcasts, RunMode mode) {
    RunReport report;
    for (const auto& podcast : podcasts) {
        if (cancel_ && cancel_->isCancelled()) {
            PodcastReport skipped;
            skipped.name = podcast.name;
            skipped.status = PodcastReport::Status::Cancelled;
            report.podcasts.push_back(skipped);
            continue;
        }
        report.podcasts.push_back(processPodcast(podcast, mode));
    }
    return report;
}

PodcastReport Orchestrator::processPodcast(const Subscription& podcast, RunMode mode) {
    PodcastReport result;
    result.name = podcast.name;

    if (!podcast.hasValidRule()) {
        result.status = PodcastReport::Status::ConfigError;
        result.error = podcast.ruleError;
        spdlog::error("{}: {}", podcast.name, podcast.ruleError);
        return result;
    }

    if (!podcast.enabled) {
        result.status = PodcastReport::Status::Disabled;
        spdlog::debug("{}: feed not enabled", podcast.name);
        return result;
    }

    std::vector<FeedEntry> entries;
    try {
        entries = feeds_.fetch(podcast);
    } catch (const std::exception& e) {
        result.status = PodcastReport::Status::FetchError;
        result.error = e.what();
        spdlog::warn("{}: {}", podcast.name, e.what());
        return result;
    }

    EpisodeCatalog catalog(podcast, podcast.destinationDir());
    std::unordered_set<std::string> completed;
    std::unordered_set<std::string> usedNames;
    for (const auto& record : store_.records(podcast.name)) {
        completed.insert(record.first);
        usedNames.insert(record.second.filename);
    }
    Reconciliation plan = catalog.reconcile(entries, completed, usedNames);
    result.discovered = plan.toDownload.size();
    result.summary.skipped = plan.alreadyDone;
    if (plan.duplicates > 0) {
        spdlog::debug("{}: ignored {} repeated entries", podcast.name, plan.duplicates);
    }
    spdlog::info("{}: {} new episodes, {} already downloaded",
                 podcast.name, plan.toDownload.size(), plan.alreadyDone);

    if (mode == RunMode::RefreshOnly) {
        result.pending = std::move(plan.toDownload);
        return result;
    }

    if (podcast.dryRun) {
        result.status = PodcastReport::Status::DryRun;
        for (const auto& episode : plan.toDownload) {
            spdlog::info("{}: {} -> {}", podcast.name, episode.sourceUrl, episode.targetPath);
        }
        result.pending = std::move(plan.toDownload);
        return result;
    }

    if (plan.toDownload.empty()) {
        return result;
    }

    DownloadScheduler scheduler(store_, cancel_);
    result.downloadsStarted = true;
    DownloadSummary summary = scheduler.run(plan.toDownload, parallelism_, transfer_);
    summary.skipped = plan.alreadyDone;
    result.summary = std::move(summary);
    if (result.summary.cancelled > 0) {
        result.status = PodcastReport::Status::Cancelled;
    }
    return result;
}

size_t RunReport::totalDiscovered() const {
    size_t total = 0;
    for (const auto& p : podcasts) total += p.discovered;
    return total;
}

size_t RunReport::totalDownloaded() const {
    size_t total = 0;
    for (const auto& p : podcasts) total += p.summary.downloaded;
    return total;
}

size_t RunReport::totalFailed() const {
    size_t total = 0;
    for (const auto& p : podcasts) total += p.summary.failed;
    return total;
}

bool RunReport::hasFailures() const {
    for (const auto& p : podcasts) {
        if (p.status == PodcastReport::Status::ConfigError ||
            p.status == PodcastReport::Status::FetchError ||
            p.summary.failed > 0) {
            return true;
        }
    }
    return false;
}

bool RunReport::wasCancelled() const {
    for (const auto& p : podcasts) {
        if (p.status == PodcastReport::Status::Cancelled) {
            return true;
        }
    }
    return false;
}

int RunReport::exitCode() const {
    if (hasFailures()) return 1;
    if (wasCancelled()) return 2;
    return 0;
}

void RunReport::print(std::ostream& out, bool verbose) const {
    out << std::string(60, '-') << "\n";
    for (const auto& p : podcasts) {
        out << std::left << std::setw(20) << p.name << " | ";
        switch (p.status) {
            case PodcastReport::Status::ConfigError:
            case PodcastReport::Status::FetchError:
                out << statusName(p.status) << ": " << p.error << "\n";
                continue;
            case PodcastReport::Status::Disabled:
                out << statusName(p.status) << "\n";
                continue;
            default:
                break;
        }

        out << p.discovered << " new, " << p.summary.skipped << " already downloaded";
        if (p.downloadsStarted) {
            out << ", " << p.summary.downloaded << " downloaded, " << p.summary.failed << " failed";
        }
        if (p.summary.cancelled > 0 || p.status == PodcastReport::Status::Cancelled) {
            out << ", cancelled";
        }
        if (p.status == PodcastReport::Status::DryRun) {
            out << " (dry run)";
        }
        out << "\n";

        if (verbose || p.status == PodcastReport::Status::DryRun) {
            for (const auto& episode : p.pending) {
                out << "    " << episode.sourceUrl << " -> " << episode.targetPath << "\n";
            }
        }
        for (const auto& failure : p.summary.failures) {
            out << "    FAILED " << failure.episode.sourceUrl << " -> " << failure.episode.filename
                << ": " << failure.cause << "\n";
        }
    }
    out << std::string(60, '-') << "\n";
    out << totalDiscovered() << " new episodes, " << totalDownloaded() << " downloaded, "
        << totalFailed() << " failed\n";
}

} // namespace core
} // namespace podfetch
