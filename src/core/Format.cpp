#include "core/Format.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <vector>

namespace podfetch {
namespace core {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

// Tags that end a line of text
bool isBreakingTag(const std::string& name) {
    static const std::vector<std::string> tags = {
        "br", "p", "/p", "div", "/div", "li", "/li", "/ul", "/ol", "h1", "h2", "h3", "/h1", "/h2", "/h3"
    };
    return std::find(tags.begin(), tags.end(), name) != tags.end();
}

std::string decodeEntity(const std::string& entity) {
    if (entity == "amp") return "&";
    if (entity == "lt") return "<";
    if (entity == "gt") return ">";
    if (entity == "quot") return "\"";
    if (entity == "apos" || entity == "#39") return "'";
    if (entity == "nbsp") return " ";
    return "&" + entity + ";";
}

} // namespace

std::string humanizeSize(std::uint64_t sizeBytes) {
    if (sizeBytes == 0) {
        return "0 B";
    }

    static const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    constexpr std::size_t unitCount = sizeof(units) / sizeof(units[0]);

    double size = static_cast<double>(sizeBytes);
    std::size_t unitIndex = 0;
    while (size >= 1024.0 && unitIndex < unitCount - 1) {
        size /= 1024.0;
        ++unitIndex;
    }

    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << size << " " << units[unitIndex];
    return out.str();
}

std::string htmlToText(const std::string& html) {
    std::string text;
    text.reserve(html.size());

    std::size_t i = 0;
    while (i < html.size()) {
        char c = html[i];

        if (c == '<') {
            std::size_t close = html.find('>', i);
            if (close == std::string::npos) {
                break;
            }
            std::string tag = lowercase(html.substr(i + 1, close - i - 1));
            std::string name = tag.substr(0, tag.find_first_of(" \t\n/", tag[0] == '/' ? 1 : 0));
            if (isBreakingTag(name)) {
                if (!text.empty() && text.back() == ' ') {
                    text.pop_back();
                }
                if (!text.empty() && text.back() != '\n') {
                    text += '\n';
                }
            }
            i = close + 1;
            continue;
        }

        if (c == '&') {
            std::size_t semicolon = html.find(';', i);
            if (semicolon != std::string::npos && semicolon - i <= 8) {
                text += decodeEntity(html.substr(i + 1, semicolon - i - 1));
                i = semicolon + 1;
                continue;
            }
        }

        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!text.empty() && text.back() != ' ' && text.back() != '\n') {
                text += ' ';
            }
        } else {
            text += c;
        }
        ++i;
    }

    // Trim trailing spaces and newlines
    text.erase(text.find_last_not_of(" \n") + 1);
    return text;
}

} // namespace core
} // namespace podfetch
