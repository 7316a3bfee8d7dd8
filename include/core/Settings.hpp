#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

namespace podfetch {
namespace core {

struct Settings {
    std::string feedUrl;
    std::size_t blockSize;
    std::string destination;
    std::string ledgerPath;
    std::string extension;
    bool skip;
    unsigned maxAttempts;

    // Defaults; destination is the current working directory
    Settings();

    // Overlay keys present in a JSON settings file
    void loadFile(const std::string& path);
    void apply(const nlohmann::json& j);

    // Overlay PODFETCH_* environment variables. The lookup is injectable for tests.
    using EnvLookup = std::function<const char*(const char*)>;
    void applyEnvironment(const EnvLookup& lookup);
    void applyEnvironment();

    // Throws std::runtime_error when the result cannot be used
    void validate() const;

    nlohmann::json toJson() const;
    static Settings fromJson(const nlohmann::json& j);
};

} // namespace core
} // namespace podfetch
