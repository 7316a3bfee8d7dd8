#pragma once

#include "core/HttpClient.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace podfetch {
namespace core {

enum class TransferFailure {
    None,
    Transient,   // Network failures exhausted a finite attempt budget
    Filesystem,  // Temp file or final path could not be written
    Cancelled    // Interrupted; the temp file is kept for the next run
};

const char* toString(TransferFailure failure);

struct TransferRequest {
    std::string url;
    std::filesystem::path tempPath;
    std::filesystem::path finalPath;
    std::size_t blockSize = 1048576;
    std::optional<std::uint64_t> declaredLength;
};

struct TransferResult {
    TransferFailure failure = TransferFailure::None;
    std::string message;
    std::uint64_t bytes = 0; // Size of the final file, or of the temp file on failure

    bool ok() const { return failure == TransferFailure::None; }
};

// Observer for one transfer's progress. All hooks are advisory.
class TransferListener {
public:
    virtual ~TransferListener() = default;

    virtual void onProgress(std::uint64_t bytes, std::optional<std::uint64_t> total) {}
    virtual void onRetry(unsigned attempt, std::chrono::seconds delay, const std::string& reason) {}

    // The server answered a range request with the whole resource
    virtual void onRangeIgnored(std::uint64_t discardedBytes) {}
};

// Blocks for the given delay. Returns false if cancelled while waiting.
using Waiter = std::function<bool(std::chrono::seconds)>;

class ResumableTransfer {
public:
    ResumableTransfer(HttpClient& client, const std::atomic<bool>& cancelled);

    // Replace the blocking backoff wait, e.g. to avoid real sleeps in tests
    void setWaiter(Waiter waiter) { waiter_ = std::move(waiter); }

    // 0 means retry transient failures forever
    void setMaxAttempts(unsigned maxAttempts) { maxAttempts_ = maxAttempts; }

    void setListener(TransferListener* listener) { listener_ = listener; }

    // Deliver url to request.finalPath, resuming from request.tempPath.
    // The final path only ever appears complete, by renaming the temp file.
    TransferResult transfer(const TransferRequest& request);

    // min(60, 2^min(attempt, 6)) seconds
    static std::chrono::seconds backoffDelay(unsigned attempt);

private:
    struct TransferState;

    enum class PassOutcome {
        BodyExhausted,
        Transient,
        Filesystem,
        Cancelled
    };

    struct Pass {
        PassOutcome outcome;
        std::string message;
        std::uint64_t received = 0;
    };

    Pass fetchOnce(TransferState& state);
    TransferResult publish(TransferState& state);
    bool waitInterruptibly(std::chrono::seconds delay) const;
    TransferResult failure(TransferFailure kind, const std::string& message, const TransferState& state) const;

    HttpClient& client_;
    const std::atomic<bool>& cancelled_;
    Waiter waiter_;
    unsigned maxAttempts_ = 0;
    TransferListener* listener_ = nullptr;
};

} // namespace core
} // namespace podfetch
