#include "core/CommandLine.hpp"
#include "core/DownloadScheduler.hpp"
#include "core/EpisodeCatalog.hpp"
#include "core/EpisodeDownloader.hpp"
#include "core/Errors.hpp"
#include "core/FeedManager.hpp"
#include "core/Orchestrator.hpp"
#include "core/PodcastFeed.hpp"
#include "core/StateStore.hpp"
#include "core/SubstitutionRule.hpp"
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

using namespace podfetch::core;

namespace {

CancellationToken g_cancel;

void signalHandler(int) {
    g_cancel.cancel();
}

void printHelp() {
    std::cout << "\nUsage: podfetch [options] [command [arguments]]\n\n"
              << "Commands:\n"
              << "  run                  - Refresh every feed and download new episodes (default)\n"
              << "  list                 - List configured podcasts\n"
              << "  add <name> <url> [rule]\n"
              << "                       - Add a podcast, optionally with a filename rule\n"
              << "  remove <name>        - Remove a podcast\n\n"
              << "Options:\n"
              << "  -c, --confdir DIR    - Configuration directory (default ~/.podfetch)\n"
              << "  -d, --downloads N    - Number of simultaneous downloads\n"
              << "  -t, --timeout SECS   - Transfer idle timeout (default 5)\n"
              << "  -r, --refresh        - Refresh episode lists only\n"
              << "  -s, --sed RULE       - Test a filename rule against URL arguments or --probe\n"
              << "  -p, --probe FEED     - List a feed's media URLs with their local filenames\n"
              << "  -v, --verbose        - Increase verbosity (repeatable)\n"
              << "  -h, --help           - Show this help\n\n"
              << "Filename rules use sed syntax: s<D>pattern<D>replacement<D>, with \\1..\\9\n"
              << "referring to the pattern's groups, e.g. s,^.+/([^/]+)/media([.]\\w+)$,\\1\\2,\n\n";
}

void configureLogging(int verbose) {
    spdlog::set_pattern("%l: %v");
    if (verbose > 1) {
        spdlog::set_level(spdlog::level::debug);
    } else if (verbose == 1) {
        spdlog::set_level(spdlog::level::info);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

void printPodcastList(const FeedManager& feedManager) {
    const auto& subscriptions = feedManager.getSubscriptions();
    if (subscriptions.empty()) {
        std::cout << "No podcasts configured.\n";
        return;
    }

    std::cout << "\nConfigured Podcasts:\n";
    std::cout << std::string(60, '-') << "\n";
    for (const auto& sub : subscriptions) {
        std::string marker = sub.enabled ? "  " : "- ";
        std::cout << marker << std::left << std::setw(20) << sub.name
                  << " | " << sub.feedUrl << "\n";
        if (!sub.sedRule.empty()) {
            std::cout << std::string(23, ' ') << "| rule " << sub.sedRule
                      << (sub.hasValidRule() ? "" : "  (invalid)") << "\n";
        }
    }
    std::cout << std::string(60, '-') << "\n";
    std::cout << "- = disabled\n";
}

// --sed / --probe: show what filenames a rule would produce
int testRule(const Options& opts) {
    Subscription probe("probe", opts.probe.value_or(""), opts.sed.value_or(""));
    if (opts.sed) {
        probe.rule = SubstitutionRule::parse(*opts.sed);
    }
    EpisodeCatalog catalog(probe, ".");

    std::vector<std::string> urls;
    if (opts.probe) {
        HttpFeedSource source;
        for (const auto& entry : source.fetch(probe)) {
            urls.push_back(entry.url);
        }
    } else {
        urls.assign(opts.commands.begin(), opts.commands.end());
    }

    if (urls.empty()) {
        std::cerr << "Nothing to test: give URLs after --sed, or a feed with --probe\n";
        return 1;
    }

    for (const auto& url : urls) {
        std::cout << url << "\n"
                  << "    -> " << catalog.resolveFilename(url) << "\n";
    }
    return 0;
}

int handleCommand(FeedManager& feedManager, const Options& opts) {
    const std::string command = opts.commands.empty() ? "run" : opts.commands[0];
    std::vector<std::string> args;
    if (!opts.commands.empty()) {
        args.assign(opts.commands.begin() + 1, opts.commands.end());
    }

    if (command == "list") {
        printPodcastList(feedManager);
        return 0;
    }
    if (command == "add") {
        if (args.size() < 2) {
            std::cout << "Usage: add <name> <url> [rule]\n";
            return 1;
        }
        if (!feedManager.addPodcast(args[0], args[1], args.size() > 2 ? args[2] : "")) {
            std::cerr << "Could not add " << args[0] << ": name or URL already configured\n";
            return 1;
        }
        std::cout << "Added podcast: " << args[0] << "\n";
        return 0;
    }
    if (command == "remove") {
        if (args.empty()) {
            std::cout << "Usage: remove <name>\n";
            return 1;
        }
        if (!feedManager.removePodcast(args[0])) {
            std::cerr << "Podcast not found: " << args[0] << "\n";
            return 1;
        }
        std::cout << "Removed podcast: " << args[0] << "\n";
        return 0;
    }
    if (command != "run") {
        std::cout << "Unknown command. Use --help for available commands.\n";
        return 1;
    }

    if (feedManager.onlyExample()) {
        spdlog::critical("review and edit the configuration in {}", feedManager.configPath());
        return 1;
    }

    int parallel = opts.downloads > 0 ? opts.downloads : feedManager.parallelDownloads();

    StateStore store(feedManager.stateDir());
    HttpFeedSource source;
    DownloaderOptions downloaderOptions;
    downloaderOptions.stallTimeout = std::chrono::milliseconds(static_cast<long>(opts.timeout * 1000));
    EpisodeDownloader downloader(downloaderOptions, &g_cancel);
    Orchestrator orchestrator(source, store, downloader, parallel, &g_cancel);

    spdlog::info("Refreshing {} feeds, {} simultaneous downloads",
                 feedManager.getSubscriptions().size(), parallel);
    RunReport report = orchestrator.runOnce(feedManager.getSubscriptions(),
                                            opts.refresh ? RunMode::RefreshOnly : RunMode::Full);
    report.print(std::cout, opts.verbose > 0);

    if (report.wasCancelled()) {
        std::cout << "Interrupted; unfinished episodes will be fetched on the next run.\n";
    }
    return report.exitCode();
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    Options opts;
    try {
        opts = parseArguments(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        printHelp();
        return 1;
    }

    if (!opts.commands.empty() && opts.commands[0] == "help") {
        printHelp();
        return 0;
    }

    configureLogging(opts.verbose);

    try {
        if (opts.sed || opts.probe) {
            return testRule(opts);
        }

        FeedManager feedManager(opts.confdir);
        if (!feedManager.configExists()) {
            feedManager.createSample();
            spdlog::critical("review and edit the configuration in {}", feedManager.configPath());
            return 1;
        }
        feedManager.load();

        return handleCommand(feedManager, opts);
    }
    catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
