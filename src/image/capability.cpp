#include "capability.hpp"
#include "format.hpp"

#include <algorithm>
#include <cctype>

#include <FreeImage.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace Image {

std::vector<std::string> QueryFreeImageCapabilities() {
    std::vector<std::string> reported;
    const int count = FreeImage_GetFIFCount();
    for (int i = 0; i < count; ++i) {
        const auto fif = static_cast<FREE_IMAGE_FORMAT>(i);
        if (!FreeImage_FIFSupportsReading(fif) && !FreeImage_FIFSupportsWriting(fif)) {
            continue;
        }
        if (const char *mime = FreeImage_GetFIFMimeType(fif)) {
            reported.emplace_back(mime);
        }
    }
    return reported;
}

std::set<std::string> FilterCapabilities(const std::vector<std::string> &reported) {
    std::set<std::string> formats;
    for (const auto &entry : reported) {
        std::string type(entry.substr(0, entry.find_first_of("; ")));
        std::ranges::transform(type, type.begin(), [](const unsigned char c) { return std::tolower(c); });
        if (!type.starts_with("image/")) {
            type.insert(0, "image/");
        }
        if (FormatFromMime(type)) {
            formats.insert(std::move(type));
        }
    }
    return formats;
}

const std::set<std::string> &CapabilityCache::Get() {
    std::call_once(m_once, [this] {
        m_formats = FilterCapabilities(m_query());
        spdlog::debug("Supported formats: {}", fmt::join(m_formats, ", "));
    });
    return m_formats;
}

} // namespace Image
