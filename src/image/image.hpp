#pragma once

#include "imgconv.hpp"

#include <set>
#include <string>
#include <string_view>

namespace Image {

void Initialize();

// MIME types ("image/webp", ...) the installed FreeImage and libavif can handle, computed once per process.
const std::set<std::string> &GetSupportedFormats();

void EnsureValid(const fs::path &srcPath);

// Returns "data:image/<format>;base64,...". Quality 0-100 is rescaled per format, a positive width and
// height cover-resize the image to exactly that box.
std::string ConvertToBase64(const fs::path &srcPath, std::string_view format = "webp", int quality = 80,
                            int width = 0, int height = 0);

// Same pipeline as ConvertToBase64, written to dstPath. An existing file is overwritten.
void ConvertToDisk(const fs::path &srcPath, const fs::path &dstPath, std::string_view format = "webp",
                   int quality = 80, int width = 0, int height = 0);

} // namespace Image
