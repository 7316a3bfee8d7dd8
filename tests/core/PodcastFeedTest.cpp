#include "core/PodcastFeed.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace podfetch::core;

class PodcastFeedTest : public ::testing::Test {
protected:
    const std::string sampleFeed = R"(<?xml version="1.0" encoding="UTF-8"?>
<rss version="2.0">
  <channel>
    <title>Club Show</title>
    <description>Weekly club videos</description>
    <link>https://example.com/show</link>
    <language>en</language>
    <item>
      <title>Episode 1</title>
      <description>First episode</description>
      <pubDate>Mon, 01 Jan 2024 00:00:00 +0000</pubDate>
      <enclosure url="https://example.com/ep1.mp4" length="1048576" type="video/mp4"/>
    </item>
    <item>
      <title>Episode 2</title>
      <description>Second episode</description>
      <pubDate>Mon, 08 Jan 2024 00:00:00 +0000</pubDate>
      <enclosure url="https://example.com/ep2.mp4" length="2097152" type="video/mp4"/>
    </item>
  </channel>
</rss>)";
};

TEST_F(PodcastFeedTest, ParsesChannelMetadata) {
    PodcastFeed feed;
    feed.loadFromString(sampleFeed);

    EXPECT_EQ(feed.getTitle(), "Club Show");
    EXPECT_EQ(feed.getDescription(), "Weekly club videos");
    EXPECT_EQ(feed.getLink(), "https://example.com/show");
    EXPECT_EQ(feed.getLanguage(), "en");
}

TEST_F(PodcastFeedTest, YieldsEpisodesInDocumentOrder) {
    PodcastFeed feed;
    feed.loadFromString(sampleFeed);

    auto first = feed.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->title, "Episode 1");
    EXPECT_EQ(first->description, "First episode");
    EXPECT_EQ(first->pubDate, "Mon, 01 Jan 2024 00:00:00 +0000");
    EXPECT_EQ(first->url, "https://example.com/ep1.mp4");
    EXPECT_EQ(first->length, std::optional<std::uint64_t>(1048576));
    EXPECT_EQ(first->type, "video/mp4");

    auto second = feed.next();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->title, "Episode 2");
    EXPECT_EQ(second->length, std::optional<std::uint64_t>(2097152));

    EXPECT_FALSE(feed.next().has_value());
    EXPECT_FALSE(feed.next().has_value());
}

TEST_F(PodcastFeedTest, MissingFieldsGetDefaults) {
    PodcastFeed feed;
    feed.loadFromString(R"(<rss><channel><title>T</title><item></item></channel></rss>)");

    auto episode = feed.next();
    ASSERT_TRUE(episode.has_value());
    EXPECT_EQ(episode->title, "Untitled");
    EXPECT_EQ(episode->description, "No description available");
    EXPECT_EQ(episode->pubDate, "Unknown date");
    EXPECT_TRUE(episode->url.empty());
    EXPECT_FALSE(episode->hasMedia());
    EXPECT_FALSE(episode->length.has_value());
}

TEST_F(PodcastFeedTest, UnusableLengthIsUnknown) {
    PodcastFeed feed;
    feed.loadFromString(R"(<rss><channel>
      <item><title>A</title><enclosure url="http://x/a.mp4" length="unknown" type="video/mp4"/></item>
      <item><title>B</title><enclosure url="http://x/b.mp4" length="0" type="video/mp4"/></item>
      <item><title>C</title><enclosure url="http://x/c.mp4" type="video/mp4"/></item>
    </channel></rss>)");

    for (int i = 0; i < 3; ++i) {
        auto episode = feed.next();
        ASSERT_TRUE(episode.has_value());
        EXPECT_TRUE(episode->hasMedia());
        EXPECT_FALSE(episode->length.has_value()) << episode->title;
    }
}

TEST_F(PodcastFeedTest, HtmlDescriptionIsFlattened) {
    PodcastFeed feed;
    feed.loadFromString(R"(<rss><channel><item>
      <title>A</title>
      <description><![CDATA[<p>Goals &amp; highlights</p><p>Part <b>two</b></p>]]></description>
    </item></channel></rss>)");

    auto episode = feed.next();
    ASSERT_TRUE(episode.has_value());
    EXPECT_EQ(episode->description, "Goals & highlights\nPart two");
}

TEST_F(PodcastFeedTest, NonHttpEnclosureCarriesNoMedia) {
    PodcastFeed feed;
    feed.loadFromString(R"(<rss><channel>
      <item><title>A</title><enclosure url="ftp://example.com/a.mp4" length="10"/></item>
      <item><title>B</title><enclosure url="not a url" length="10"/></item>
      <item><title>C</title><enclosure url="  https://example.com/c.mp4  " length="10"/></item>
    </channel></rss>)");

    EXPECT_FALSE(feed.next()->hasMedia());
    EXPECT_FALSE(feed.next()->hasMedia());
    auto third = feed.next();
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(third->url, "https://example.com/c.mp4");
}

TEST_F(PodcastFeedTest, MalformedXmlThrows) {
    PodcastFeed feed;
    EXPECT_THROW(feed.loadFromString("<rss><channel><item>"), std::runtime_error);
}

TEST_F(PodcastFeedTest, DocumentWithoutChannelThrows) {
    PodcastFeed feed;
    EXPECT_THROW(feed.loadFromString("<feed><entry/></feed>"), std::runtime_error);
}

TEST_F(PodcastFeedTest, EmptyUrlIsRejectedBeforeFetching) {
    PodcastFeed feed;
    EXPECT_THROW(feed.loadFromUrl(""), std::runtime_error);
}
