#include "core/StateStore.hpp"
#include "core/Errors.hpp"
#include "core/FileSync.hpp"
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace podfetch {
namespace core {

namespace {

std::string safeFileStem(const std::string& podcastId) {
    std::string stem = podcastId;
    for (char& c : stem) {
        if (c == '/' || c == '\\' || c == ':' || c == '*' || c == '?' || c == '"' ||
            c == '<' || c == '>' || c == '|' || c == '\0') {
            c = '_';
        }
    }
    if (stem.empty() || stem == "." || stem == "..") {
        stem = "_" + stem;
    }
    return stem;
}

} // namespace

StateStore::StateStore(const std::string& directory) : directory_(directory) {}

std::string StateStore::pathFor(const std::string& podcastId) const {
    return (fs::path(directory_) / (safeFileStem(podcastId) + ".jsonl")).string();
}

std::unordered_map<std::string, CompletionRecord> StateStore::records(const std::string& podcastId) const {
    std::unordered_map<std::string, CompletionRecord> result;
    const std::string path = pathFor(podcastId);

    std::ifstream file(path);
    if (!file.is_open()) {
        // Nothing downloaded for this podcast yet
        return result;
    }

    std::string line;
    size_t lineNumber = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        if (line.empty()) {
            continue;
        }
        try {
            auto j = nlohmann::json::parse(line);
            CompletionRecord record;
            record.key = j.at("key").get<std::string>();
            record.filename = j.value("filename", std::string());
            record.completedAt = std::chrono::system_clock::from_time_t(
                static_cast<std::time_t>(j.value("completedAt", static_cast<int64_t>(0))));
            result[record.key] = record;
        } catch (const nlohmann::json::exception& e) {
            // A crash in the middle of an append leaves a truncated last line
            spdlog::warn("{}:{}: ignoring unreadable state record ({})", path, lineNumber, e.what());
        }
    }
    return result;
}

std::unordered_set<std::string> StateStore::load(const std::string& podcastId) const {
    std::unordered_set<std::string> keys;
    for (const auto& entry : records(podcastId)) {
        keys.insert(entry.first);
    }
    return keys;
}

void StateStore::markComplete(const std::string& podcastId, const std::string& identityKey,
                              const std::string& resolvedFilename) {
    auto now = std::chrono::system_clock::now();
    nlohmann::json j{
        {"key", identityKey},
        {"filename", resolvedFilename},
        {"completedAt", std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count()}
    };
    std::string record;
    try {
        // Filenames come from decoded URLs and need not be valid UTF-8
        record = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
    } catch (const nlohmann::json::exception& e) {
        throw StateWriteError("Could not encode state record for " + identityKey + ": " + e.what());
    }
    const std::string path = pathFor(podcastId);

    std::lock_guard<std::mutex> lock(writeMutex_);

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw StateWriteError("Could not create state directory " + directory_ + ": " + ec.message());
    }

    // Start a fresh line if an earlier append was cut short
    bool needsNewline = false;
    {
        std::ifstream existing(path, std::ios::binary | std::ios::ate);
        if (existing.is_open() && existing.tellg() > 0) {
            existing.seekg(-1, std::ios::end);
            char last = '\n';
            existing.get(last);
            needsNewline = last != '\n';
        }
    }

    std::ofstream file(path, std::ios::app | std::ios::binary);
    if (!file.is_open()) {
        throw StateWriteError("Could not open state file for writing: " + path);
    }
    if (needsNewline) {
        file << '\n';
    }
    file << record;
    file.flush();
    if (!file) {
        throw StateWriteError("Could not append to state file: " + path);
    }
    file.close();
    if (!syncToDisk(path)) {
        throw StateWriteError("Could not sync state file: " + path);
    }
}

} // namespace core
} // namespace podfetch
