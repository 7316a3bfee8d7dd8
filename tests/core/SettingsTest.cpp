#include "core/Settings.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>
#include <map>
#include <stdexcept>

using namespace podfetch::core;
using namespace podfetch::test;

namespace {

Settings::EnvLookup lookupFrom(const std::map<std::string, std::string>& env) {
    return [env](const char* name) -> const char* {
        auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    };
}

} // namespace

TEST(SettingsTest, DefaultsMatchDocumentedValues) {
    Settings settings;

    EXPECT_TRUE(settings.feedUrl.empty());
    EXPECT_EQ(settings.blockSize, 1048576u);
    EXPECT_EQ(settings.destination, std::filesystem::current_path().string());
    EXPECT_EQ(settings.ledgerPath, "podfetch.sqlite");
    EXPECT_EQ(settings.extension, ".mp4");
    EXPECT_FALSE(settings.skip);
    EXPECT_EQ(settings.maxAttempts, 0u);
}

TEST(SettingsTest, EnvironmentOverridesFile) {
    Settings settings;
    settings.apply(nlohmann::json{{"feedUrl", "https://file.example/feed.xml"}, {"blockSize", 4096}});

    // The lookup owns the strings, so it must outlive applyEnvironment
    auto lookup = lookupFrom({{"PODFETCH_FEED_URL", "https://env.example/feed.xml"},
                              {"PODFETCH_DESTINATION", "/srv/videos"},
                              {"PODFETCH_MAX_ATTEMPTS", "5"}});
    settings.applyEnvironment(lookup);

    EXPECT_EQ(settings.feedUrl, "https://env.example/feed.xml");
    EXPECT_EQ(settings.blockSize, 4096u);
    EXPECT_EQ(settings.destination, "/srv/videos");
    EXPECT_EQ(settings.maxAttempts, 5u);
}

TEST(SettingsTest, NonNumericBlockSizeIsRejected) {
    Settings settings;
    auto lookup = lookupFrom({{"PODFETCH_BLOCK_SIZE", "1MB"}});

    EXPECT_THROW(settings.applyEnvironment(lookup), std::runtime_error);
}

TEST(SettingsTest, ValidateRequiresFeedUrl) {
    Settings settings;
    EXPECT_THROW(settings.validate(), std::runtime_error);

    settings.feedUrl = "https://example.com/feed.xml";
    EXPECT_NO_THROW(settings.validate());

    settings.blockSize = 0;
    EXPECT_THROW(settings.validate(), std::runtime_error);
}

TEST(SettingsTest, LoadsFromFile) {
    TempDir dir;
    auto path = dir.path() / "settings.json";
    writeFile(path, R"({"feedUrl": "https://example.com/feed.xml", "skip": true, "extension": ".m4a"})");

    Settings settings;
    settings.loadFile(path.string());

    EXPECT_EQ(settings.feedUrl, "https://example.com/feed.xml");
    EXPECT_TRUE(settings.skip);
    EXPECT_EQ(settings.extension, ".m4a");
    EXPECT_EQ(settings.ledgerPath, "podfetch.sqlite");
}

TEST(SettingsTest, UnreadableFileThrows) {
    TempDir dir;
    Settings settings;
    EXPECT_THROW(settings.loadFile((dir.path() / "missing.json").string()), std::runtime_error);

    auto path = dir.path() / "broken.json";
    writeFile(path, "{ not json");
    EXPECT_THROW(settings.loadFile(path.string()), std::runtime_error);
}

TEST(SettingsTest, WrongJsonTypeThrows) {
    Settings settings;
    EXPECT_THROW(settings.apply(nlohmann::json{{"blockSize", "large"}}), std::runtime_error);
    EXPECT_THROW(settings.apply(nlohmann::json::array()), std::runtime_error);
}

TEST(SettingsTest, NegativeJsonNumbersAreRejected) {
    Settings settings;
    EXPECT_THROW(settings.apply(nlohmann::json{{"blockSize", -1}}), std::runtime_error);
    EXPECT_THROW(settings.apply(nlohmann::json{{"maxAttempts", -1}}), std::runtime_error);
    EXPECT_THROW(settings.apply(nlohmann::json{{"blockSize", 1.5}}), std::runtime_error);

    EXPECT_EQ(settings.blockSize, 1048576u);
    EXPECT_EQ(settings.maxAttempts, 0u);
}

TEST(SettingsTest, ParsedJsonNumbersAreAccepted) {
    Settings settings;
    settings.apply(nlohmann::json::parse(R"({"blockSize": 65536, "maxAttempts": 4})"));

    EXPECT_EQ(settings.blockSize, 65536u);
    EXPECT_EQ(settings.maxAttempts, 4u);
}

TEST(SettingsTest, OversizedBlockFailsValidation) {
    Settings settings;
    settings.feedUrl = "https://example.com/feed.xml";

    auto lookup = lookupFrom({{"PODFETCH_BLOCK_SIZE", "134217728"}});
    settings.applyEnvironment(lookup);
    EXPECT_THROW(settings.validate(), std::runtime_error);

    settings.blockSize = 64 * 1024 * 1024;
    EXPECT_NO_THROW(settings.validate());
}

TEST(SettingsTest, MaxAttemptsBeyondRangeIsRejected) {
    Settings settings;
    EXPECT_THROW(settings.apply(nlohmann::json{{"maxAttempts", 5000000000ULL}}), std::runtime_error);
}

TEST(SettingsTest, JsonRoundTrip) {
    Settings original;
    original.feedUrl = "https://example.com/feed.xml";
    original.blockSize = 65536;
    original.destination = "/tmp/videos";
    original.skip = true;
    original.maxAttempts = 3;

    Settings copy = Settings::fromJson(original.toJson());

    EXPECT_EQ(copy.toJson(), original.toJson());
}
