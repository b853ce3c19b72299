#pragma once

#include "format.hpp"
#include "imgconv.hpp"

#include <cstdint>
#include <optional>
#include <vector>

#include <FreeImagePlus.h>

namespace Image {

struct Codec {
    // FIF_UNKNOWN when the graphics library has no plugin for the format.
    FREE_IMAGE_FORMAT Fif;
    int DefaultFlags;
    // Translates a mapped quality into save flags, nullptr for formats saved without one.
    int (*QualityFlags)(int quality);
    // Brings the pixel layout into a shape the encoder accepts.
    bool (*Prepare)(fipImage &img);
    // Set for formats handled outside FreeImage.
    imgconv::Status (*Load)(const fs::path &path, fipImage &img);
    imgconv::Status (*SaveToMemory)(fipImage &img, int flags, std::vector<uint8_t> &bytes);
    bool (*CanEncode)();
};

const Codec &CodecFor(Format format);

struct FileSink {
    fs::path Path;
};

struct BufferSink {
    std::vector<uint8_t> Bytes;
};

// Loads the file as a 32 bit bitmap.
imgconv::Status Decode(const fs::path &path, Format format, fipImage &img);

imgconv::Status Encode(fipImage &img, const FileSink &sink, Format format, std::optional<int> quality);

imgconv::Status Encode(fipImage &img, BufferSink &sink, Format format, std::optional<int> quality);

} // namespace Image
