#include "core/Settings.hpp"
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace podfetch {
namespace core {

namespace {

unsigned long long parseNumber(const std::string& name, const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::runtime_error("Invalid value for " + name + ": '" + value + "'");
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        throw std::runtime_error("Value for " + name + " is out of range: " + value);
    }
}

// Largest write block accepted; a block is buffered in memory before it is written
constexpr std::size_t maxBlockSize = 64 * 1024 * 1024;

// JSON numbers must be non-negative integers; get<unsigned>() would wrap -1
std::uint64_t unsignedField(const nlohmann::json& j, const char* key) {
    const auto& value = j.at(key);
    bool nonNegative = value.is_number_unsigned() ||
                       (value.is_number_integer() && value.get<std::int64_t>() >= 0);
    if (!nonNegative) {
        throw std::runtime_error(std::string("Invalid value for ") + key + ": " + value.dump() +
                                 " (expected a non-negative integer)");
    }
    return value.get<std::uint64_t>();
}

} // namespace

Settings::Settings()
    : blockSize(1048576),
      destination(std::filesystem::current_path().string()),
      ledgerPath("podfetch.sqlite"),
      extension(".mp4"),
      skip(false),
      maxAttempts(0) {}

void Settings::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open settings file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed settings file " + path + ": " + e.what());
    }
    apply(j);
}

void Settings::apply(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Settings must be a JSON object");
    }

    try {
        if (j.contains("feedUrl")) {
            feedUrl = j.at("feedUrl").get<std::string>();
        }
        if (j.contains("blockSize")) {
            blockSize = static_cast<std::size_t>(unsignedField(j, "blockSize"));
        }
        if (j.contains("destination")) {
            destination = j.at("destination").get<std::string>();
        }
        if (j.contains("ledgerPath")) {
            ledgerPath = j.at("ledgerPath").get<std::string>();
        }
        if (j.contains("extension")) {
            extension = j.at("extension").get<std::string>();
        }
        if (j.contains("skip")) {
            skip = j.at("skip").get<bool>();
        }
        if (j.contains("maxAttempts")) {
            auto attempts = unsignedField(j, "maxAttempts");
            if (attempts > std::numeric_limits<unsigned>::max()) {
                throw std::runtime_error("Value for maxAttempts is out of range: " + std::to_string(attempts));
            }
            maxAttempts = static_cast<unsigned>(attempts);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid settings: ") + e.what());
    }
}

void Settings::applyEnvironment(const EnvLookup& lookup) {
    if (const char* value = lookup("PODFETCH_FEED_URL")) {
        feedUrl = value;
    }
    if (const char* value = lookup("PODFETCH_BLOCK_SIZE")) {
        blockSize = static_cast<std::size_t>(parseNumber("PODFETCH_BLOCK_SIZE", value));
    }
    if (const char* value = lookup("PODFETCH_DESTINATION")) {
        destination = value;
    }
    if (const char* value = lookup("PODFETCH_LEDGER")) {
        ledgerPath = value;
    }
    if (const char* value = lookup("PODFETCH_MAX_ATTEMPTS")) {
        auto attempts = parseNumber("PODFETCH_MAX_ATTEMPTS", value);
        if (attempts > std::numeric_limits<unsigned>::max()) {
            throw std::runtime_error("Value for PODFETCH_MAX_ATTEMPTS is out of range: " + std::string(value));
        }
        maxAttempts = static_cast<unsigned>(attempts);
    }
}

void Settings::applyEnvironment() {
    applyEnvironment([](const char* name) { return std::getenv(name); });
}

void Settings::validate() const {
    if (feedUrl.empty()) {
        throw std::runtime_error("No feed URL configured. Set PODFETCH_FEED_URL or feedUrl in the settings file");
    }
    if (blockSize == 0) {
        throw std::runtime_error("Block size must be greater than zero");
    }
    if (blockSize > maxBlockSize) {
        throw std::runtime_error("Block size must not exceed " + std::to_string(maxBlockSize) + " bytes");
    }
    if (destination.empty()) {
        throw std::runtime_error("Destination directory must not be empty");
    }
    if (ledgerPath.empty()) {
        throw std::runtime_error("Ledger path must not be empty");
    }
}

nlohmann::json Settings::toJson() const {
    return nlohmann::json{
        {"feedUrl", feedUrl},
        {"blockSize", blockSize},
        {"destination", destination},
        {"ledgerPath", ledgerPath},
        {"extension", extension},
        {"skip", skip},
        {"maxAttempts", maxAttempts}
    };
}

Settings Settings::fromJson(const nlohmann::json& j) {
    Settings settings;
    settings.apply(j);
    return settings;
}

} // namespace core
} // namespace podfetch
