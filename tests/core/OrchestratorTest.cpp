#include "core/Orchestrator.hpp"
#include "core/Errors.hpp"
#include "TempDir.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <gtest/gtest.h>

using namespace podfetch::core;
using podfetch::test::TempDir;
namespace fs = std::filesystem;

namespace {

class FakeFeedSource : public FeedSource {
public:
    std::vector<FeedEntry> fetch(const Subscription& subscription) override {
        fetched.push_back(subscription.name);
        if (broken.count(subscription.name)) {
            throw FeedFetchError("HTTP 500");
        }
        return feeds[subscription.name];
    }

    void add(const std::string& podcast, const std::string& url) {
        FeedEntry entry;
        entry.url = url;
        feeds[podcast].push_back(entry);
    }

    std::map<std::string, std::vector<FeedEntry>> feeds;
    std::set<std::string> broken;
    std::vector<std::string> fetched;
};

// Writes a small file at the target path, like a successful download would
class RecordingTransfer {
public:
    void operator()(const Episode& episode) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            calls_.push_back(episode.sourceUrl);
            if (failing_.count(episode.sourceUrl)) {
                throw TransferError("HTTP 503");
            }
        }
        fs::create_directories(fs::path(episode.targetPath).parent_path());
        std::ofstream(episode.targetPath) << episode.sourceUrl;
    }

    void failOn(const std::string& url) { failing_.insert(url); }
    size_t callCount() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return calls_.size();
    }
    void reset() {
        std::lock_guard<std::mutex> lk(mtx_);
        calls_.clear();
    }

private:
    mutable std::mutex mtx_;
    std::vector<std::string> calls_;
    std::set<std::string> failing_;
};

class OrchestratorTest : public ::testing::Test {
protected:
    OrchestratorTest() : store(dir.sub("state")) {}

    Subscription podcast(const std::string& name, const std::string& rule = "") {
        Subscription sub(name, "https://feeds.example.com/" + name + ".rss", rule);
        sub.destDir = dir.sub("media") + "/{name}";
        sub.compileRule();
        return sub;
    }

    Orchestrator orchestrator(const CancellationToken* cancel = nullptr) {
        return Orchestrator(feeds, store, [this](const Episode& e) { transfer(e); }, 2, cancel);
    }

    TempDir dir;
    StateStore store;
    FakeFeedSource feeds;
    RecordingTransfer transfer;
};

} // namespace

TEST_F(OrchestratorTest, DownloadsNewEpisodesIntoDestination) {
    feeds.add("show", "https://example.com/show/e1.mp3");
    feeds.add("show", "https://example.com/show/e2.mp3");

    RunReport report = orchestrator().runOnce({podcast("show")}, RunMode::Full);

    ASSERT_EQ(report.podcasts.size(), 1u);
    EXPECT_EQ(report.podcasts[0].status, PodcastReport::Status::Ok);
    EXPECT_EQ(report.podcasts[0].summary.downloaded, 2u);
    EXPECT_TRUE(fs::exists(dir.path() / "media" / "show" / "e1.mp3"));
    EXPECT_TRUE(fs::exists(dir.path() / "media" / "show" / "e2.mp3"));
    EXPECT_EQ(report.exitCode(), 0);
}

TEST_F(OrchestratorTest, SecondRunDownloadsNothing) {
    feeds.add("show", "https://example.com/show/e1.mp3");
    feeds.add("show", "https://example.com/show/e2.mp3");
    std::vector<Subscription> podcasts = {podcast("show")};

    orchestrator().runOnce(podcasts, RunMode::Full);
    transfer.reset();
    RunReport second = orchestrator().runOnce(podcasts, RunMode::Full);

    EXPECT_EQ(transfer.callCount(), 0u);
    EXPECT_EQ(second.totalDownloaded(), 0u);
    EXPECT_EQ(second.podcasts[0].summary.skipped, 2u);
    EXPECT_FALSE(second.podcasts[0].downloadsStarted);
    EXPECT_EQ(second.exitCode(), 0);
}

TEST_F(OrchestratorTest, RefreshOnlyReportsDiscoveriesWithoutDownloading) {
    feeds.add("alpha", "https://example.com/alpha/e1.mp3");
    feeds.add("alpha", "https://example.com/alpha/e2.mp3");
    feeds.add("beta", "https://example.com/beta/e1.mp3");

    RunReport report = orchestrator().runOnce({podcast("alpha"), podcast("beta")}, RunMode::RefreshOnly);

    EXPECT_EQ(report.totalDiscovered(), 3u);
    EXPECT_EQ(transfer.callCount(), 0u);
    for (const auto& p : report.podcasts) {
        EXPECT_FALSE(p.downloadsStarted);
    }
    EXPECT_EQ(report.podcasts[0].pending.size(), 2u);
    EXPECT_TRUE(store.load("alpha").empty());
    EXPECT_TRUE(store.load("beta").empty());
}

TEST_F(OrchestratorTest, FeedFailureIsIsolated) {
    feeds.broken.insert("down");
    feeds.add("up", "https://example.com/up/e1.mp3");

    RunReport report = orchestrator().runOnce({podcast("down"), podcast("up")}, RunMode::Full);

    ASSERT_EQ(report.podcasts.size(), 2u);
    EXPECT_EQ(report.podcasts[0].status, PodcastReport::Status::FetchError);
    EXPECT_EQ(report.podcasts[0].error, "HTTP 500");
    EXPECT_EQ(report.podcasts[1].status, PodcastReport::Status::Ok);
    EXPECT_EQ(report.podcasts[1].summary.downloaded, 1u);
    EXPECT_EQ(report.exitCode(), 1);
}

TEST_F(OrchestratorTest, MalformedRuleSkipsOnlyThatPodcast) {
    feeds.add("bad", "https://example.com/bad/e1.mp3");
    feeds.add("good", "https://example.com/good/e1.mp3");

    RunReport report = orchestrator().runOnce({podcast("bad", "s/a/b"), podcast("good")}, RunMode::Full);

    EXPECT_EQ(report.podcasts[0].status, PodcastReport::Status::ConfigError);
    EXPECT_NE(report.podcasts[0].error.find("s/a/b"), std::string::npos);
    EXPECT_EQ(feeds.fetched, std::vector<std::string>{"good"});
    EXPECT_EQ(report.podcasts[1].summary.downloaded, 1u);
    EXPECT_EQ(report.exitCode(), 1);
}

TEST_F(OrchestratorTest, TransferFailureIsListedAndRetriedNextRun) {
    feeds.add("show", "https://example.com/show/e1.mp3");
    feeds.add("show", "https://example.com/show/e2.mp3");
    transfer.failOn("https://example.com/show/e2.mp3");
    std::vector<Subscription> podcasts = {podcast("show")};

    RunReport report = orchestrator().runOnce(podcasts, RunMode::Full);

    EXPECT_EQ(report.podcasts[0].summary.downloaded, 1u);
    EXPECT_EQ(report.podcasts[0].summary.failed, 1u);
    EXPECT_EQ(report.exitCode(), 1);

    std::ostringstream out;
    report.print(out, false);
    EXPECT_NE(out.str().find("FAILED https://example.com/show/e2.mp3"), std::string::npos);
    EXPECT_NE(out.str().find("HTTP 503"), std::string::npos);

    RunReport again = orchestrator().runOnce(podcasts, RunMode::Full);
    EXPECT_EQ(again.podcasts[0].discovered, 1u);
    EXPECT_EQ(again.podcasts[0].summary.skipped, 1u);
}

TEST_F(OrchestratorTest, WrittenButUnrecordedEpisodeIsFetchedOnceMore) {
    feeds.add("show", "https://example.com/show/e1.mp3");
    std::vector<Subscription> podcasts = {podcast("show")};

    // A previous run wrote the file and died before recording it
    fs::create_directories(dir.path() / "media" / "show");
    std::ofstream((dir.path() / "media" / "show" / "e1.mp3").string()) << "partial run";

    orchestrator().runOnce(podcasts, RunMode::Full);
    EXPECT_EQ(transfer.callCount(), 1u);

    orchestrator().runOnce(podcasts, RunMode::Full);
    EXPECT_EQ(transfer.callCount(), 1u);
}

TEST_F(OrchestratorTest, EditingTheRuleDoesNotRedownload) {
    feeds.add("show", "https://media.example.com/show/slug-one/media.mp3");

    orchestrator().runOnce({podcast("show")}, RunMode::Full);
    EXPECT_TRUE(fs::exists(dir.path() / "media" / "show" / "media.mp3"));

    RunReport report = orchestrator().runOnce({podcast("show", R"(s,^.+/([^/]+)/media([.]\w+)$,\1\2,)")}, RunMode::Full);

    EXPECT_EQ(transfer.callCount(), 1u);
    EXPECT_EQ(report.podcasts[0].summary.skipped, 1u);
}

TEST_F(OrchestratorTest, DisabledPodcastIsNotFetched) {
    Subscription off = podcast("off");
    off.enabled = false;

    RunReport report = orchestrator().runOnce({off}, RunMode::Full);

    EXPECT_EQ(report.podcasts[0].status, PodcastReport::Status::Disabled);
    EXPECT_TRUE(feeds.fetched.empty());
    EXPECT_EQ(report.exitCode(), 0);
}

TEST_F(OrchestratorTest, DryRunListsPlannedFilesOnly) {
    feeds.add("show", "https://example.com/show/e1.mp3");
    Subscription dry = podcast("show");
    dry.dryRun = true;

    RunReport report = orchestrator().runOnce({dry}, RunMode::Full);

    EXPECT_EQ(report.podcasts[0].status, PodcastReport::Status::DryRun);
    EXPECT_EQ(transfer.callCount(), 0u);
    ASSERT_EQ(report.podcasts[0].pending.size(), 1u);
    EXPECT_EQ(report.podcasts[0].pending[0].targetPath,
              (dir.path() / "media" / "show" / "e1.mp3").string());

    std::ostringstream out;
    report.print(out, false);
    EXPECT_NE(out.str().find("(dry run)"), std::string::npos);
}

TEST_F(OrchestratorTest, CancelledRunSkipsRemainingPodcasts) {
    feeds.add("show", "https://example.com/show/e1.mp3");
    CancellationToken cancel;
    cancel.cancel();

    RunReport report = orchestrator(&cancel).runOnce({podcast("show")}, RunMode::Full);

    EXPECT_EQ(report.podcasts[0].status, PodcastReport::Status::Cancelled);
    EXPECT_TRUE(feeds.fetched.empty());
    EXPECT_EQ(report.exitCode(), 2);
}

TEST_F(OrchestratorTest, RejectsNonPositiveParallelism) {
    auto build = [this]() { Orchestrator unused(feeds, store, [](const Episode&) {}, 0); };
    EXPECT_THROW(build(), std::invalid_argument);
}

TEST_F(OrchestratorTest, EpisodesSharingABasenameKeepSeparateFiles) {
    feeds.add("show", "https://media.example.com/show/slug-two/media.mp3");
    feeds.add("show", "https://media.example.com/show/slug-one/media.mp3");

    RunReport first = orchestrator().runOnce({podcast("show")}, RunMode::Full);
    EXPECT_EQ(first.podcasts[0].summary.downloaded, 2u);

    // A later episode with the same basename must not replace either file
    feeds.feeds["show"].insert(feeds.feeds["show"].begin(), FeedEntry());
    feeds.feeds["show"].front().url = "https://media.example.com/show/slug-three/media.mp3";
    RunReport second = orchestrator().runOnce({podcast("show")}, RunMode::Full);
    EXPECT_EQ(second.podcasts[0].summary.downloaded, 1u);

    const fs::path showDir = dir.path() / "media" / "show";
    auto contents = [](const fs::path& path) {
        std::ifstream file(path.string());
        return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    };
    EXPECT_EQ(contents(showDir / "media.mp3"), "https://media.example.com/show/slug-two/media.mp3");
    EXPECT_EQ(contents(showDir / "media-2.mp3"), "https://media.example.com/show/slug-one/media.mp3");
    EXPECT_EQ(contents(showDir / "media-3.mp3"), "https://media.example.com/show/slug-three/media.mp3");
}
