#pragma once

#include "imgconv.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <FreeImagePlus.h>
#include <avif/avif.h>

namespace Image {

// Maps quality [0, 100] onto the AV1 quantizer [0, 63] (0 best, 63 worst).
constexpr int AvifQuantizer(const int quality) {
    const int q = std::clamp(quality, 0, 100);
    return ((100 - q) * AVIF_QUANTIZER_WORST_QUALITY + 50) / 100;
}

bool AvifCanDecode();

bool AvifCanEncode();

// "image/avif" when libavif was built with an AV1 codec, nothing otherwise.
std::vector<std::string> QueryAvifCapabilities();

// Checks for an ISOBMFF "ftyp" box with an avif/avis brand.
bool IsAvifFile(const fs::path &path);

// Parses the container only; returns width and height.
std::optional<std::pair<unsigned, unsigned>> AvifDimensions(const fs::path &path);

imgconv::Status LoadAvif(const fs::path &path, fipImage &img);

// Expects a 32 bit bitmap.
imgconv::Status SaveAvifToMemory(fipImage &img, int quantizer, std::vector<uint8_t> &bytes);

} // namespace Image
