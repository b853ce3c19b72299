#pragma once

#include "imgconv.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace Image {

enum class Format {
    Jpeg,
    Png,
    Gif,
    Webp,
    Bmp,
    Avif,
};

inline constexpr std::array<Format, 6> AllFormats = {Format::Jpeg, Format::Png, Format::Gif,
                                                     Format::Webp, Format::Bmp, Format::Avif};

// Short lowercase name, as accepted on the command line ("jpeg", "webp", ...).
std::string_view FormatName(Format format);

// "image/<name>"
std::string MimeType(Format format);

std::optional<Format> FormatFromMime(std::string_view mime);

// Lowercases the name and prefixes it with "image/".
std::string NormalizeMime(std::string_view name);

imgconv::Result<Format> ParseFormat(std::string_view name);

// Native quality range upper bound, absent for formats without a quality setting.
std::optional<int> QualityCeiling(Format format);

std::optional<int> MapQuality(int requested, Format format);

} // namespace Image
