#include "core/ConsoleReporter.hpp"
#include "core/Format.hpp"
#include <iomanip>

namespace podfetch {
namespace core {

ConsoleReporter::ConsoleReporter(std::ostream& out, std::ostream& err)
    : out_(out), err_(err), progressLineOpen_(false) {}

void ConsoleReporter::endProgressLine() {
    if (progressLineOpen_) {
        out_ << "\n";
        progressLineOpen_ = false;
    }
}

void ConsoleReporter::onProgress(std::uint64_t bytes, std::optional<std::uint64_t> total) {
    double percent = 0.0;
    if (total && *total > 0) {
        percent = static_cast<double>(bytes) * 100.0 / static_cast<double>(*total);
    }
    out_ << "\rcompleted " << humanizeSize(bytes) << " "
         << std::fixed << std::setprecision(2) << percent << "%                    " << std::flush;
    progressLineOpen_ = true;
}

void ConsoleReporter::onRetry(unsigned attempt, std::chrono::seconds delay, const std::string& reason) {
    endProgressLine();
    err_ << "Network error: " << reason << ". Retrying in " << delay.count() << "s (attempt " << attempt << ")"
         << std::endl;
}

void ConsoleReporter::onRangeIgnored(std::uint64_t discardedBytes) {
    endProgressLine();
    err_ << "Server ignored the resume request, discarding " << humanizeSize(discardedBytes)
         << " and starting over" << std::endl;
}

void ConsoleReporter::onSkipLedger(const Episode&, const std::string&) {
    // Already handled on an earlier run; stay quiet
}

void ConsoleReporter::onSkipExisting(const Episode&, const std::filesystem::path& finalPath) {
    out_ << "Already on disk, recording: " << finalPath.string() << "\n";
}

void ConsoleReporter::onSizeMismatch(const Episode& episode, std::uint64_t onDisk, std::uint64_t declared) {
    err_ << "Warning: " << episode.title << " is " << humanizeSize(onDisk) << " on disk but the feed declares "
         << humanizeSize(declared) << std::endl;
}

void ConsoleReporter::onNoMedia(const Episode& episode) {
    out_ << "title: " << episode.title << " " << episode.pubDate << "\n";
    out_ << "No URL available for this show. Skipping download.\n";
}

void ConsoleReporter::onMarkedSkipped(const Episode&, const std::string& id) {
    out_ << "Skipping download per flag, recorded: " << id << "\n";
}

void ConsoleReporter::onDownloadStart(const Episode& episode, const std::filesystem::path& finalPath) {
    out_ << "title: " << episode.title << " " << episode.pubDate << "\n";
    out_ << "description: " << episode.description << "\n";
    out_ << "url: " << episode.url << " length: " << humanizeSize(episode.length.value_or(0))
         << " type: " << episode.type << "\n";
    out_ << finalPath.string() << "\n";
}

void ConsoleReporter::onDownloadSuccess(const Episode& episode, const TransferResult& result) {
    endProgressLine();
    out_ << "Saved " << episode.title << " (" << humanizeSize(result.bytes) << ")\n";
}

void ConsoleReporter::onDownloadFailure(const Episode& episode, const TransferResult& result) {
    endProgressLine();
    if (result.failure == TransferFailure::Cancelled) {
        out_ << "Download interrupted by user. Partial file kept for resume ("
             << humanizeSize(result.bytes) << ").\n";
        return;
    }
    err_ << "Error downloading " << episode.url << " [" << toString(result.failure) << "]: " << result.message
         << std::endl;
}

} // namespace core
} // namespace podfetch
