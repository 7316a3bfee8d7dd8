#pragma once

#include "core/EpisodeProcessor.hpp"
#include <iostream>

namespace podfetch {
namespace core {

// Prints lifecycle events and a progress line rewritten in place
class ConsoleReporter : public EpisodeListener {
public:
    explicit ConsoleReporter(std::ostream& out = std::cout, std::ostream& err = std::cerr);

    void onProgress(std::uint64_t bytes, std::optional<std::uint64_t> total) override;
    void onRetry(unsigned attempt, std::chrono::seconds delay, const std::string& reason) override;
    void onRangeIgnored(std::uint64_t discardedBytes) override;

    void onSkipLedger(const Episode& episode, const std::string& id) override;
    void onSkipExisting(const Episode& episode, const std::filesystem::path& finalPath) override;
    void onSizeMismatch(const Episode& episode, std::uint64_t onDisk, std::uint64_t declared) override;
    void onNoMedia(const Episode& episode) override;
    void onMarkedSkipped(const Episode& episode, const std::string& id) override;
    void onDownloadStart(const Episode& episode, const std::filesystem::path& finalPath) override;
    void onDownloadSuccess(const Episode& episode, const TransferResult& result) override;
    void onDownloadFailure(const Episode& episode, const TransferResult& result) override;

private:
    void endProgressLine();

    std::ostream& out_;
    std::ostream& err_;
    bool progressLineOpen_;
};

} // namespace core
} // namespace podfetch
