#include "core/PodcastFeed.hpp"
#include "core/Format.hpp"
#include <stdexcept>
#include <sstream>
#include <iostream>
#include <algorithm>
#include <cpr/cpr.h>
#include <pugixml.hpp>
#include <ada.h>

namespace podfetch {
namespace core {

PodcastFeed::PodcastFeed() {
    // No initialization needed
}

std::string PodcastFeed::cleanAndValidateUrl(const std::string& url) const {
    if (url.empty()) {
        return "";
    }

    // Trim whitespace
    std::string cleaned = url;
    cleaned.erase(0, cleaned.find_first_not_of(" \t\n\r"));
    cleaned.erase(cleaned.find_last_not_of(" \t\n\r") + 1);

    if (cleaned.empty()) {
        return "";
    }

    // Use ada-url for proper URL parsing and validation
    auto parsed_url = ada::parse<ada::url>(cleaned);
    if (!parsed_url) {
        std::cerr << "Warning: Ignoring malformed enclosure URL: " << cleaned << std::endl;
        return "";
    }

    if (parsed_url->get_protocol() != "http:" && parsed_url->get_protocol() != "https:") {
        std::cerr << "Warning: Ignoring non-HTTP enclosure URL: " << cleaned << std::endl;
        return "";
    }

    return parsed_url->get_href();
}

void PodcastFeed::loadFromUrl(const std::string& url) {
    if (url.empty()) {
        throw std::runtime_error("Empty URL provided");
    }

    auto response = cpr::Get(
        cpr::Url{url},
        cpr::Header{
            {"User-Agent", "Mozilla/5.0 (compatible; podfetch/1.0)"},
            {"Accept", "application/rss+xml, application/xml, text/xml"}
        },
        cpr::Timeout{30000}, // 30 seconds
        cpr::Redirect{50L},
        cpr::VerifySsl{true}
    );

    if (response.status_code != 200) {
        std::stringstream err;
        err << "Failed to fetch podcast feed: HTTP " << response.status_code;
        if (response.error.code != cpr::ErrorCode::OK) {
            err << " (" << response.error.message << ")";
        }
        throw std::runtime_error(err.str());
    }

    if (response.text.empty()) {
        throw std::runtime_error("Empty response received from feed URL");
    }

    // Validate content type
    auto content_type_it = response.header.find("content-type");
    if (content_type_it != response.header.end()) {
        std::string type = content_type_it->second;
        std::transform(type.begin(), type.end(), type.begin(), ::tolower);
        if (type.find("xml") == std::string::npos &&
            type.find("rss") == std::string::npos) {
            std::cerr << "Warning: Unexpected content type: " << type << std::endl;
        }
    }

    loadFromString(response.text);
}

void PodcastFeed::loadFromString(const std::string& xml) {
    pugi::xml_parse_result result = doc_.load_string(xml.c_str());
    if (!result) {
        throw std::runtime_error("Failed to parse XML feed: " + std::string(result.description()));
    }

    title_.clear();
    description_.clear();
    link_.clear();
    language_.clear();

    pugi::xml_node channel = doc_.child("rss").child("channel");
    if (!channel) {
        throw std::runtime_error("Invalid podcast feed format: no rss/channel element found");
    }

    if (auto title = channel.child("title")) {
        title_ = title.text().get();
    }

    if (auto description = channel.child("description")) {
        description_ = description.text().get();
    }

    if (auto link = channel.child("link")) {
        link_ = link.text().get();
    }

    if (auto language = channel.child("language")) {
        language_ = language.text().get();
    }

    cursor_ = channel.child("item");
}

std::optional<Episode> PodcastFeed::next() {
    if (!cursor_) {
        return std::nullopt;
    }

    Episode episode = parseItem(cursor_);
    cursor_ = cursor_.next_sibling("item");
    return episode;
}

Episode PodcastFeed::parseItem(const pugi::xml_node& item) const {
    Episode episode;

    episode.title = item.child("title").text().get();
    if (episode.title.empty()) {
        episode.title = "Untitled";
    }

    std::string description = item.child("description").text().get();
    episode.description = description.empty() ? "No description available" : htmlToText(description);

    episode.pubDate = item.child("pubDate").text().get();
    if (episode.pubDate.empty()) {
        episode.pubDate = "Unknown date";
    }

    if (auto enclosure = item.child("enclosure")) {
        episode.url = cleanAndValidateUrl(enclosure.attribute("url").value());
        episode.length = Episode::parseLength(enclosure.attribute("length").value());
        episode.type = enclosure.attribute("type").value();
    }

    return episode;
}

} // namespace core
} // namespace podfetch
