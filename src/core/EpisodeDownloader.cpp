#include "core/EpisodeDownloader.hpp"
#include "core/Errors.hpp"
#include "core/FileSync.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace podfetch {
namespace core {

namespace {

void removeQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::warn("could not remove {}: {}", path.string(), ec.message());
    }
}

} // namespace

EpisodeDownloader::EpisodeDownloader(DownloaderOptions options, const CancellationToken* cancel)
    : options_(std::move(options)), cancel_(cancel) {}

std::string EpisodeDownloader::temporaryPathFor(const std::string& targetPath) {
    return targetPath + ".part";
}

void EpisodeDownloader::operator()(const Episode& episode) const {
    const fs::path finalPath = episode.targetPath;
    const fs::path tempPath = temporaryPathFor(episode.targetPath);

    std::error_code ec;
    if (finalPath.has_parent_path()) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            throw TransferError("cannot create " + finalPath.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw TransferError("cannot open " + tempPath.string() + " for writing");
    }

    // Stall detection and shutdown both abort the transfer from the progress callback
    using Clock = std::chrono::steady_clock;
    auto lastProgress = Clock::now();
    cpr::cpr_pf_arg_t lastReceived = 0;
    bool stalled = false;
    bool cancelled = false;

    auto onProgress = [&](cpr::cpr_pf_arg_t /*downloadTotal*/, cpr::cpr_pf_arg_t downloadNow,
                          cpr::cpr_pf_arg_t /*uploadTotal*/, cpr::cpr_pf_arg_t /*uploadNow*/,
                          intptr_t /*userdata*/) -> bool {
        if (cancel_ && cancel_->isCancelled()) {
            cancelled = true;
            return false;
        }
        auto now = Clock::now();
        if (downloadNow > lastReceived) {
            lastReceived = downloadNow;
            lastProgress = now;
        } else if (now - lastProgress > options_.stallTimeout) {
            stalled = true;
            return false;
        }
        return true;
    };

    cpr::Response response = cpr::Download(
        file,
        cpr::Url{episode.sourceUrl},
        cpr::Header{{"User-Agent", options_.userAgent}},
        cpr::ConnectTimeout{options_.connectTimeout},
        cpr::Redirect{50L},
        cpr::ProgressCallback{onProgress}
    );

    file.close();
    const bool writeFailed = file.fail();

    if (cancelled) {
        removeQuietly(tempPath);
        throw TransferCancelledError();
    }

    if (stalled) {
        removeQuietly(tempPath);
        std::stringstream err;
        err << "timeout: no data for " << options_.stallTimeout.count() / 1000.0 << "s";
        throw TransferError(err.str());
    }

    if (response.error.code != cpr::ErrorCode::OK) {
        removeQuietly(tempPath);
        throw TransferError("network: " + response.error.message);
    }

    if (response.status_code < 200 || response.status_code >= 300) {
        removeQuietly(tempPath);
        std::stringstream err;
        err << "HTTP " << response.status_code;
        throw TransferError(err.str());
    }

    if (writeFailed) {
        removeQuietly(tempPath);
        throw TransferError("write to " + tempPath.string() + " failed");
    }

    auto size = fs::file_size(tempPath, ec);
    if (!ec && episode.length > 0 && size != episode.length) {
        spdlog::debug("{}: got {} bytes, feed announced {}", episode.filename, size, episode.length);
    }

    if (!syncToDisk(tempPath.string())) {
        removeQuietly(tempPath);
        throw TransferError("cannot sync " + tempPath.string() + " to disk");
    }

    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        removeQuietly(tempPath);
        throw TransferError("cannot move into " + finalPath.string() + ": " + ec.message());
    }
    // Persist the rename itself; the data is already safe
    if (finalPath.has_parent_path()) {
        syncToDisk(finalPath.parent_path().string());
    }
}

} // namespace core
} // namespace podfetch
