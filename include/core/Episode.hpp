#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace podfetch {
namespace core {

struct Episode {
    std::string title;
    std::string description;
    std::string pubDate;
    std::string url;                     // Empty means the item carries no media
    std::optional<std::uint64_t> length; // Declared by the enclosure, not trusted
    std::string type;

    bool hasMedia() const { return !url.empty(); }

    // Parse an enclosure length attribute. Non-numeric and zero values are unknown.
    static std::optional<std::uint64_t> parseLength(const std::string& value);
};

// Remove the characters that are unsafe in a file name: \ / : . + ? *
std::string cleanTitle(const std::string& title);

// The file name an episode is stored under; also its ledger key
std::string outputIdentifier(const Episode& episode, const std::string& extension);

// Single-pass source of episodes in feed order
class EpisodeSource {
public:
    virtual ~EpisodeSource() = default;

    // Next episode, or nullopt once the source is exhausted
    virtual std::optional<Episode> next() = 0;
};

} // namespace core
} // namespace podfetch
