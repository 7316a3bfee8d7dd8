#include "core/HttpClient.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <cpr/cpr.h>

namespace podfetch {
namespace core {

namespace {

std::string trim(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.remove_suffix(1);
    }
    return std::string(value);
}

std::optional<std::uint64_t> parseUnsigned(const std::string& value) {
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(std::strtoull(value.c_str(), nullptr, 10));
}

// Feeds raw header lines into a ResponseHead. A status line starts a
// fresh response, so only the last hop of a redirect chain survives.
void parseHeaderLine(std::string_view line, ResponseHead& head) {
    std::string text = trim(line);
    if (text.empty()) {
        return;
    }

    if (text.compare(0, 5, "HTTP/") == 0) {
        head.headers.clear();
        head.statusCode = 0;
        std::istringstream status(text);
        std::string version;
        status >> version >> head.statusCode;
        return;
    }

    auto colon = text.find(':');
    if (colon == std::string::npos) {
        return;
    }

    std::string name = text.substr(0, colon);
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    head.headers[name] = trim(std::string_view(text).substr(colon + 1));
}

} // namespace

std::optional<std::string> ResponseHead::header(const std::string& name) const {
    auto it = headers.find(name);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::uint64_t> ResponseHead::contentRangeTotal() const {
    auto range = header("content-range");
    if (!range) {
        return std::nullopt;
    }
    auto slash = range->rfind('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }
    return parseUnsigned(trim(std::string_view(*range).substr(slash + 1)));
}

std::optional<std::uint64_t> ResponseHead::contentRangeStart() const {
    auto range = header("content-range");
    if (!range) {
        return std::nullopt;
    }
    std::string value = trim(*range);
    if (value.compare(0, 6, "bytes ") != 0) {
        return std::nullopt;
    }
    auto dash = value.find('-', 6);
    if (dash == std::string::npos) {
        return std::nullopt;
    }
    return parseUnsigned(trim(std::string_view(value).substr(6, dash - 6)));
}

std::optional<std::uint64_t> ResponseHead::contentLength() const {
    auto length = header("content-length");
    if (!length) {
        return std::nullopt;
    }
    return parseUnsigned(*length);
}

CprHttpClient::CprHttpClient(long connectTimeoutSeconds, long stallTimeoutSeconds)
    : connectTimeoutSeconds_(connectTimeoutSeconds), stallTimeoutSeconds_(stallTimeoutSeconds) {}

FetchResult CprHttpClient::get(const std::string& url,
                               std::uint64_t offset,
                               const HeadHandler& onHead,
                               const DataHandler& onData) {
    ResponseHead head;
    bool headDelivered = false;
    FetchResult result;

    cpr::Header headers{
        {"User-Agent", "Mozilla/5.0 (compatible; podfetch/1.0)"},
        {"Accept", "*/*"}
    };
    if (offset > 0) {
        headers["Range"] = "bytes=" + std::to_string(offset) + "-";
    }

    auto deliverHead = [&]() {
        headDelivered = true;
        if (!onHead(head)) {
            result.aborted = true;
            return false;
        }
        return true;
    };

    auto response = cpr::Get(
        cpr::Url{url},
        headers,
        cpr::ConnectTimeout{static_cast<std::int32_t>(connectTimeoutSeconds_ * 1000)},
        cpr::LowSpeed{1, static_cast<std::int32_t>(stallTimeoutSeconds_)},
        cpr::Redirect{50L},
        cpr::VerifySsl{true},
        cpr::HeaderCallback{[&](std::string_view line, intptr_t) {
            parseHeaderLine(line, head);
            return true;
        }},
        cpr::WriteCallback{[&](std::string_view data, intptr_t) {
            if (!headDelivered && !deliverHead()) {
                return false;
            }
            if (!onData(data)) {
                result.aborted = true;
                return false;
            }
            return true;
        }}
    );

    if (result.aborted) {
        return result;
    }

    if (response.error.code != cpr::ErrorCode::OK) {
        result.error = response.error.message.empty() ? "transfer failed" : response.error.message;
        return result;
    }

    // Empty body: the head has not been seen by the caller yet
    if (!headDelivered) {
        if (head.statusCode == 0) {
            head.statusCode = response.status_code;
        }
        deliverHead();
    }
    return result;
}

} // namespace core
} // namespace podfetch
