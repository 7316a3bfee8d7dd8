#pragma once

#include "core/Episode.hpp"
#include <optional>
#include <string>
#include <pugixml.hpp>

namespace podfetch {
namespace core {

class PodcastFeed : public EpisodeSource {
public:
    PodcastFeed();
    ~PodcastFeed() override = default;

    PodcastFeed(const PodcastFeed&) = delete;
    PodcastFeed& operator=(const PodcastFeed&) = delete;

    // Fetch and parse a podcast feed from a URL
    void loadFromUrl(const std::string& url);

    // Parse an already fetched feed document
    void loadFromString(const std::string& xml);

    // Episodes are built one item at a time, in document order
    std::optional<Episode> next() override;

    // Get feed metadata
    std::string getTitle() const { return title_; }
    std::string getDescription() const { return description_; }
    std::string getLink() const { return link_; }
    std::string getLanguage() const { return language_; }

private:
    Episode parseItem(const pugi::xml_node& item) const;
    std::string cleanAndValidateUrl(const std::string& url) const;

    std::string title_;
    std::string description_;
    std::string link_;
    std::string language_;
    pugi::xml_document doc_;
    pugi::xml_node cursor_;
};

} // namespace core
} // namespace podfetch
