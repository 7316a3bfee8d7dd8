#pragma once

#include <cstdint>
#include <string>

namespace podfetch {
namespace core {

// Two decimals and a binary unit, e.g. "1.46 KB". Zero is "0 B".
std::string humanizeSize(std::uint64_t sizeBytes);

// Flatten an HTML episode description to readable text
std::string htmlToText(const std::string& html);

} // namespace core
} // namespace podfetch
