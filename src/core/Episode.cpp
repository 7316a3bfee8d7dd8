#include "core/Episode.hpp"
#include <algorithm>
#include <cctype>
#include <limits>

namespace podfetch {
namespace core {

std::optional<std::uint64_t> Episode::parseLength(const std::string& value) {
    std::string trimmed = value;
    trimmed.erase(0, trimmed.find_first_not_of(" \t\n\r"));
    trimmed.erase(trimmed.find_last_not_of(" \t\n\r") + 1);

    if (trimmed.empty()) {
        return std::nullopt;
    }

    bool allDigits = std::all_of(trimmed.begin(), trimmed.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
    if (!allDigits) {
        return std::nullopt;
    }

    std::uint64_t result = 0;
    for (char c : trimmed) {
        std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (result > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        result = result * 10 + digit;
    }

    if (result == 0) {
        return std::nullopt;
    }
    return result;
}

std::string cleanTitle(const std::string& title) {
    static const std::string badCharacters = "\\/:.+?*";

    std::string cleaned;
    cleaned.reserve(title.size());
    for (char c : title) {
        if (badCharacters.find(c) == std::string::npos) {
            cleaned += c;
        }
    }
    return cleaned;
}

std::string outputIdentifier(const Episode& episode, const std::string& extension) {
    std::string name = cleanTitle(episode.title);
    if (name.empty()) {
        name = "Untitled";
    }
    return name + extension;
}

} // namespace core
} // namespace podfetch
