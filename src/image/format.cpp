#include "format.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace Image {

std::string_view FormatName(const Format format) {
    switch (format) {
    case Format::Jpeg:
        return "jpeg";
    case Format::Png:
        return "png";
    case Format::Gif:
        return "gif";
    case Format::Webp:
        return "webp";
    case Format::Bmp:
        return "bmp";
    case Format::Avif:
        return "avif";
    }
    return "";
}

std::string MimeType(const Format format) {
    return fmt::format("image/{}", FormatName(format));
}

std::optional<Format> FormatFromMime(const std::string_view mime) {
    const auto it = std::ranges::find_if(AllFormats, [&](const Format f) { return MimeType(f) == mime; });
    if (it == AllFormats.end()) {
        return std::nullopt;
    }
    return *it;
}

std::string NormalizeMime(const std::string_view name) {
    std::string lower(name);
    std::ranges::transform(lower, lower.begin(), [](const unsigned char c) { return std::tolower(c); });
    return "image/" + lower;
}

imgconv::Result<Format> ParseFormat(const std::string_view name) {
    const auto mime = NormalizeMime(name);
    if (const auto format = FormatFromMime(mime)) {
        return *format;
    }
    return imgconv::Fail(imgconv::ErrorKind::Format, "Format not supported: {}", mime);
}

std::optional<int> QualityCeiling(const Format format) {
    switch (format) {
    case Format::Jpeg:
    case Format::Webp:
    case Format::Avif:
        return 100;
    case Format::Png:
        return 9;
    case Format::Gif:
    case Format::Bmp:
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<int> MapQuality(const int requested, const Format format) {
    const auto ceiling = QualityCeiling(format);
    if (!ceiling) {
        return std::nullopt;
    }
    const int clamped = std::clamp(requested, 0, 100);
    return static_cast<int>(std::lround(clamped / 100.0 * *ceiling));
}

} // namespace Image
