#include "core/EpisodeProcessor.hpp"

namespace fs = std::filesystem;

namespace podfetch {
namespace core {

const char* toString(EpisodeOutcome outcome) {
    switch (outcome) {
        case EpisodeOutcome::SkippedLedger:   return "skipped (ledger)";
        case EpisodeOutcome::SkippedExisting: return "skipped (exists)";
        case EpisodeOutcome::NoMedia:         return "no media";
        case EpisodeOutcome::MarkedSkipped:   return "marked as downloaded";
        case EpisodeOutcome::Downloaded:      return "downloaded";
        case EpisodeOutcome::Failed:          return "failed";
        case EpisodeOutcome::Cancelled:       return "cancelled";
    }
    return "unknown";
}

EpisodeProcessor::EpisodeProcessor(CompletionLedger& ledger,
                                   ResumableTransfer& transfer,
                                   const ProcessorOptions& options,
                                   EpisodeListener* listener)
    : ledger_(ledger), transfer_(transfer), options_(options), listener_(listener) {}

fs::path EpisodeProcessor::finalPathFor(const std::string& id) const {
    return options_.destination / id;
}

fs::path EpisodeProcessor::tempPathFor(const std::string& id) const {
    return options_.destination / (id + ".part");
}

void EpisodeProcessor::commit(const std::string& id) {
    // DuplicateEntry is a lost race or a replayed commit, both harmless
    ledger_.record(id);
}

EpisodeOutcome EpisodeProcessor::process(const Episode& episode) {
    const std::string id = outputIdentifier(episode, options_.extension);
    const fs::path finalPath = finalPathFor(id);

    if (ledger_.contains(id)) {
        if (listener_) listener_->onSkipLedger(episode, id);
        return EpisodeOutcome::SkippedLedger;
    }

    std::error_code ec;
    if (fs::exists(finalPath, ec)) {
        auto onDisk = fs::file_size(finalPath, ec);
        if (!ec && episode.length && onDisk != *episode.length && listener_) {
            listener_->onSizeMismatch(episode, onDisk, *episode.length);
        }
        commit(id);
        if (listener_) listener_->onSkipExisting(episode, finalPath);
        return EpisodeOutcome::SkippedExisting;
    }

    if (!episode.hasMedia()) {
        commit(id);
        if (listener_) listener_->onNoMedia(episode);
        return EpisodeOutcome::NoMedia;
    }

    if (options_.skipMode) {
        commit(id);
        if (listener_) listener_->onMarkedSkipped(episode, id);
        return EpisodeOutcome::MarkedSkipped;
    }

    if (listener_) listener_->onDownloadStart(episode, finalPath);

    TransferRequest request;
    request.url = episode.url;
    request.tempPath = tempPathFor(id);
    request.finalPath = finalPath;
    request.blockSize = options_.blockSize;
    request.declaredLength = episode.length;

    transfer_.setListener(listener_);
    TransferResult result = transfer_.transfer(request);
    transfer_.setListener(nullptr);

    if (!result.ok()) {
        if (listener_) listener_->onDownloadFailure(episode, result);
        return result.failure == TransferFailure::Cancelled ? EpisodeOutcome::Cancelled : EpisodeOutcome::Failed;
    }

    commit(id);
    if (listener_) listener_->onDownloadSuccess(episode, result);
    return EpisodeOutcome::Downloaded;
}

BatchSummary EpisodeProcessor::run(EpisodeSource& source, const std::atomic<bool>& cancelled) {
    BatchSummary summary;

    while (!cancelled) {
        auto episode = source.next();
        if (!episode) {
            break;
        }
        ++summary.seen;

        switch (process(*episode)) {
            case EpisodeOutcome::SkippedLedger:
            case EpisodeOutcome::SkippedExisting:
                ++summary.skipped;
                break;
            case EpisodeOutcome::NoMedia:
            case EpisodeOutcome::MarkedSkipped:
                ++summary.recorded;
                break;
            case EpisodeOutcome::Downloaded:
                ++summary.downloaded;
                break;
            case EpisodeOutcome::Failed:
                ++summary.failed;
                break;
            case EpisodeOutcome::Cancelled:
                summary.cancelled = true;
                return summary;
        }
    }

    if (cancelled) {
        summary.cancelled = true;
    }
    return summary;
}

} // namespace core
} // namespace podfetch
