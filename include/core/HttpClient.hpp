#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace podfetch {
namespace core {

// Status and headers of the final response (after redirects).
// Header names are lower-case.
struct ResponseHead {
    long statusCode = 0;
    std::map<std::string, std::string> headers;

    std::optional<std::string> header(const std::string& name) const;

    // Total from "Content-Range: bytes a-b/total" or "bytes */total"
    std::optional<std::uint64_t> contentRangeTotal() const;
    // First byte from "Content-Range: bytes a-b/total"
    std::optional<std::uint64_t> contentRangeStart() const;
    std::optional<std::uint64_t> contentLength() const;
};

struct FetchResult {
    bool aborted = false; // A callback returned false
    std::string error;    // Transport failure, empty on a clean exchange

    bool transportFailed() const { return !aborted && !error.empty(); }
};

class HttpClient {
public:
    using HeadHandler = std::function<bool(const ResponseHead&)>;
    using DataHandler = std::function<bool(std::string_view)>;

    virtual ~HttpClient() = default;

    // GET url, asking for bytes from offset onward when offset > 0.
    // onHead is called once, before any body bytes reach onData, or after
    // the exchange when the body is empty. Either handler may return false
    // to abort the request.
    virtual FetchResult get(const std::string& url,
                            std::uint64_t offset,
                            const HeadHandler& onHead,
                            const DataHandler& onData) = 0;
};

class CprHttpClient : public HttpClient {
public:
    explicit CprHttpClient(long connectTimeoutSeconds = 30, long stallTimeoutSeconds = 60);

    FetchResult get(const std::string& url,
                    std::uint64_t offset,
                    const HeadHandler& onHead,
                    const DataHandler& onData) override;

private:
    long connectTimeoutSeconds_;
    long stallTimeoutSeconds_;
};

} // namespace core
} // namespace podfetch
