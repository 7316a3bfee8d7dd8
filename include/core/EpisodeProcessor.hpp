#pragma once

#include "core/CompletionLedger.hpp"
#include "core/Episode.hpp"
#include "core/ResumableTransfer.hpp"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>

namespace podfetch {
namespace core {

enum class EpisodeOutcome {
    SkippedLedger,   // Already recorded as complete
    SkippedExisting, // File found on disk, ledger backfilled
    NoMedia,         // Nothing to download, recorded as handled
    MarkedSkipped,   // Skip mode: recorded without transferring
    Downloaded,
    Failed,          // No ledger entry, retried next run
    Cancelled
};

const char* toString(EpisodeOutcome outcome);

// Lifecycle notifications for the reporting side. Default bodies do nothing.
class EpisodeListener : public TransferListener {
public:
    virtual void onSkipLedger(const Episode& episode, const std::string& id) {}
    virtual void onSkipExisting(const Episode& episode, const std::filesystem::path& finalPath) {}
    virtual void onSizeMismatch(const Episode& episode, std::uint64_t onDisk, std::uint64_t declared) {}
    virtual void onNoMedia(const Episode& episode) {}
    virtual void onMarkedSkipped(const Episode& episode, const std::string& id) {}
    virtual void onDownloadStart(const Episode& episode, const std::filesystem::path& finalPath) {}
    virtual void onDownloadSuccess(const Episode& episode, const TransferResult& result) {}
    virtual void onDownloadFailure(const Episode& episode, const TransferResult& result) {}
};

struct ProcessorOptions {
    std::filesystem::path destination;
    std::string extension = ".mp4";
    std::size_t blockSize = 1048576;
    bool skipMode = false;
};

struct BatchSummary {
    unsigned seen = 0;
    unsigned downloaded = 0;
    unsigned skipped = 0;   // Ledger hits and existing files
    unsigned recorded = 0;  // No media and skip mode
    unsigned failed = 0;
    bool cancelled = false;
};

class EpisodeProcessor {
public:
    EpisodeProcessor(CompletionLedger& ledger,
                     ResumableTransfer& transfer,
                     const ProcessorOptions& options,
                     EpisodeListener* listener = nullptr);

    // Resolve one episode: ledger, then filesystem, then network
    EpisodeOutcome process(const Episode& episode);

    // Process every episode in order. Stops early once cancelled.
    BatchSummary run(EpisodeSource& source, const std::atomic<bool>& cancelled);

    std::filesystem::path finalPathFor(const std::string& id) const;
    std::filesystem::path tempPathFor(const std::string& id) const;

private:
    // Ledger insert where a duplicate means somebody else already recorded it
    void commit(const std::string& id);

    CompletionLedger& ledger_;
    ResumableTransfer& transfer_;
    ProcessorOptions options_;
    EpisodeListener* listener_;
};

} // namespace core
} // namespace podfetch
