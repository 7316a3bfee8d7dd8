#include "core/ResumableTransfer.hpp"
#include <algorithm>
#include <fstream>
#include <thread>

namespace fs = std::filesystem;

namespace podfetch {
namespace core {

const char* toString(TransferFailure failure) {
    switch (failure) {
        case TransferFailure::None:       return "none";
        case TransferFailure::Transient:  return "network";
        case TransferFailure::Filesystem: return "filesystem";
        case TransferFailure::Cancelled:  return "cancelled";
    }
    return "unknown";
}

struct ResumableTransfer::TransferState {
    std::string url;
    fs::path tempPath;
    fs::path finalPath;
    std::uint64_t bytesDone = 0;
    std::optional<std::uint64_t> totalLength;
    unsigned attempts = 0;
    std::size_t blockSize = 0;
};

ResumableTransfer::ResumableTransfer(HttpClient& client, const std::atomic<bool>& cancelled)
    : client_(client), cancelled_(cancelled) {}

std::chrono::seconds ResumableTransfer::backoffDelay(unsigned attempt) {
    unsigned exponent = std::min(attempt, 6u);
    return std::chrono::seconds(std::min<long long>(60, 1LL << exponent));
}

TransferResult ResumableTransfer::transfer(const TransferRequest& request) {
    std::error_code ec;

    // Somebody already finished this one
    if (fs::exists(request.finalPath, ec)) {
        TransferResult done;
        done.message = "already present";
        auto size = fs::file_size(request.finalPath, ec);
        done.bytes = ec ? 0 : size;
        return done;
    }

    TransferState state;
    state.url = request.url;
    state.tempPath = request.tempPath;
    state.finalPath = request.finalPath;
    state.blockSize = std::max<std::size_t>(request.blockSize, 1);
    state.totalLength = request.declaredLength;

    auto dir = request.finalPath.parent_path();
    if (!dir.empty()) {
        fs::create_directories(dir, ec);
        if (ec) {
            return failure(TransferFailure::Filesystem,
                           "Cannot create directory " + dir.string() + ": " + ec.message(), state);
        }
    }

    if (fs::exists(state.tempPath, ec)) {
        auto size = fs::file_size(state.tempPath, ec);
        if (ec) {
            return failure(TransferFailure::Filesystem,
                           "Cannot stat " + state.tempPath.string() + ": " + ec.message(), state);
        }
        state.bytesDone = size;
    }

    while (true) {
        if (cancelled_) {
            return failure(TransferFailure::Cancelled, "Transfer interrupted", state);
        }

        if (state.totalLength && state.bytesDone >= *state.totalLength) {
            return publish(state);
        }

        Pass pass = fetchOnce(state);

        switch (pass.outcome) {
            case PassOutcome::Filesystem:
                return failure(TransferFailure::Filesystem, pass.message, state);
            case PassOutcome::Cancelled:
                return failure(TransferFailure::Cancelled, "Transfer interrupted", state);
            case PassOutcome::BodyExhausted:
                // Stream closure is the only completion signal we get
                if (!state.totalLength || state.bytesDone >= *state.totalLength) {
                    return publish(state);
                }
                if (pass.received > 0) {
                    state.attempts = 0;
                    continue;
                }
                pass.message = "Response ended with " + std::to_string(*state.totalLength - state.bytesDone) +
                               " bytes outstanding";
                break;
            case PassOutcome::Transient:
                break;
        }

        ++state.attempts;
        if (maxAttempts_ > 0 && state.attempts >= maxAttempts_) {
            return failure(TransferFailure::Transient,
                           pass.message + " (gave up after " + std::to_string(state.attempts) + " attempts)",
                           state);
        }

        auto delay = backoffDelay(state.attempts);
        if (listener_) {
            listener_->onRetry(state.attempts, delay, pass.message);
        }
        if (!waitInterruptibly(delay)) {
            return failure(TransferFailure::Cancelled, "Transfer interrupted", state);
        }
    }
}

ResumableTransfer::Pass ResumableTransfer::fetchOnce(TransferState& state) {
    Pass pass{PassOutcome::BodyExhausted, {}, 0};
    const std::uint64_t offset = state.bytesDone;

    std::ofstream out;
    std::string buffer;
    buffer.reserve(state.blockSize);

    bool writeFailed = false;
    bool interrupted = false;
    bool rangeSatisfied = false;
    std::optional<std::uint64_t> misalignedStart;
    long unexpectedStatus = 0;

    auto flush = [&]() {
        if (buffer.empty()) {
            return true;
        }
        out.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        out.flush();
        if (!out) {
            writeFailed = true;
            pass.message = "Cannot write " + state.tempPath.string();
            return false;
        }
        state.bytesDone += buffer.size();
        pass.received += buffer.size();
        buffer.clear();
        if (listener_) {
            listener_->onProgress(state.bytesDone, state.totalLength);
        }
        return true;
    };

    auto onHead = [&](const ResponseHead& head) {
        const bool resuming = offset > 0;

        if (resuming && head.statusCode == 200) {
            // Range ignored: the partial file cannot be trusted to line up
            if (listener_) {
                listener_->onRangeIgnored(offset);
            }
            state.bytesDone = 0;
        } else if (head.statusCode == 416) {
            auto total = head.contentRangeTotal();
            if (total && *total <= offset) {
                state.totalLength = total;
                rangeSatisfied = true;
            } else {
                unexpectedStatus = head.statusCode;
            }
            return false;
        } else if (head.statusCode != 200 && head.statusCode != 206) {
            unexpectedStatus = head.statusCode;
            return false;
        }

        if (head.statusCode == 206) {
            auto start = head.contentRangeStart();
            if (start && *start != offset) {
                // Appending would leave a gap or an overlap; start over from zero
                if (listener_) {
                    listener_->onRangeIgnored(offset);
                }
                state.bytesDone = 0;
                std::ofstream truncate(state.tempPath, std::ios::binary | std::ios::trunc);
                if (!truncate) {
                    writeFailed = true;
                    pass.message = "Cannot truncate " + state.tempPath.string();
                    return false;
                }
                misalignedStart = start;
                return false;
            }
        }

        if (auto total = head.contentRangeTotal()) {
            state.totalLength = total;
        } else if (auto length = head.contentLength()) {
            state.totalLength = *length + (head.statusCode == 206 ? offset : 0);
        } else if (head.statusCode == 200) {
            // Full content of unknown size: only the end of the stream marks completion
            state.totalLength.reset();
        }

        auto mode = std::ios::binary | (state.bytesDone > 0 ? std::ios::app : std::ios::trunc);
        out.open(state.tempPath, mode);
        if (!out) {
            writeFailed = true;
            pass.message = "Cannot open " + state.tempPath.string();
            return false;
        }
        return true;
    };

    auto onData = [&](std::string_view data) {
        if (cancelled_) {
            interrupted = true;
            return false;
        }
        while (!data.empty()) {
            std::size_t take = std::min(state.blockSize - buffer.size(), data.size());
            buffer.append(data.data(), take);
            data.remove_prefix(take);
            if (buffer.size() >= state.blockSize && !flush()) {
                return false;
            }
        }
        return true;
    };

    FetchResult fetched = client_.get(state.url, offset, onHead, onData);

    // Whatever arrived before a drop or an interrupt is a valid prefix
    if (out.is_open()) {
        if (!writeFailed) {
            flush();
        }
        out.close();
    }

    if (writeFailed) {
        pass.outcome = PassOutcome::Filesystem;
    } else if (interrupted) {
        pass.outcome = PassOutcome::Cancelled;
    } else if (rangeSatisfied) {
        pass.outcome = PassOutcome::BodyExhausted;
    } else if (misalignedStart) {
        pass.outcome = PassOutcome::Transient;
        pass.message = "Server answered from byte " + std::to_string(*misalignedStart) + " instead of " +
                       std::to_string(offset);
    } else if (unexpectedStatus != 0) {
        pass.outcome = PassOutcome::Transient;
        pass.message = "Unexpected HTTP status " + std::to_string(unexpectedStatus);
    } else if (fetched.transportFailed()) {
        pass.outcome = PassOutcome::Transient;
        pass.message = fetched.error;
    } else if (fetched.aborted) {
        pass.outcome = PassOutcome::Transient;
        pass.message = "Request aborted";
    }
    return pass;
}

TransferResult ResumableTransfer::publish(TransferState& state) {
    std::error_code ec;

    // An empty body never opened the temp file
    if (!fs::exists(state.tempPath, ec)) {
        std::ofstream touch(state.tempPath, std::ios::binary);
        if (!touch) {
            return failure(TransferFailure::Filesystem, "Cannot create " + state.tempPath.string(), state);
        }
    }

    fs::rename(state.tempPath, state.finalPath, ec);
    if (ec) {
        return failure(TransferFailure::Filesystem,
                       "Cannot move " + state.tempPath.string() + " to " + state.finalPath.string() + ": " +
                           ec.message(),
                       state);
    }

    TransferResult done;
    auto size = fs::file_size(state.finalPath, ec);
    done.bytes = ec ? state.bytesDone : size;
    return done;
}

bool ResumableTransfer::waitInterruptibly(std::chrono::seconds delay) const {
    if (waiter_) {
        return waiter_(delay);
    }

    const auto deadline = std::chrono::steady_clock::now() + delay;
    while (std::chrono::steady_clock::now() < deadline) {
        if (cancelled_) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return !cancelled_;
}

TransferResult ResumableTransfer::failure(TransferFailure kind,
                                          const std::string& message,
                                          const TransferState& state) const {
    TransferResult result;
    result.failure = kind;
    result.message = message;

    std::error_code ec;
    auto size = fs::file_size(state.tempPath, ec);
    result.bytes = ec ? 0 : size;
    return result;
}

} // namespace core
} // namespace podfetch
