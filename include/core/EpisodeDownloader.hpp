#pragma once

#include "core/DownloadScheduler.hpp"
#include "core/EpisodeCatalog.hpp"
#include <chrono>
#include <string>

namespace podfetch {
namespace core {

struct DownloaderOptions {
    std::chrono::milliseconds stallTimeout{5000};   // no bytes received for this long = failure
    std::chrono::milliseconds connectTimeout{15000};
    std::string userAgent = "Mozilla/5.0 (compatible; podfetch/1.0)";
};

// HTTP transfer for the download scheduler. Data goes to "<target>.part" and is
// renamed onto the target only once the whole body has been written.
class EpisodeDownloader {
public:
    explicit EpisodeDownloader(DownloaderOptions options = DownloaderOptions(),
                               const CancellationToken* cancel = nullptr);

    // Throws TransferError, or TransferCancelledError on shutdown
    void operator()(const Episode& episode) const;

    static std::string temporaryPathFor(const std::string& targetPath);

private:
    DownloaderOptions options_;
    const CancellationToken* cancel_;
};

} // namespace core
} // namespace podfetch
