#include "codec.hpp"
#include "avif.hpp"
#include "utils.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

namespace Image {

namespace {

// FreeImage reads 0 as "use the default", so the lowest quality is sent as 1.
int LossyFlags(const int quality) {
    return std::clamp(quality, 1, 100);
}

int PngFlags(const int level) {
    return level <= 0 ? PNG_Z_NO_COMPRESSION : std::min(level, 9);
}

bool KeepLayout(fipImage &) {
    return true;
}

bool To24Bits(fipImage &img) {
    if (img.getBitsPerPixel() == 24 || img.getBitsPerPixel() == 8) {
        return true;
    }
    return img.convertTo24Bits();
}

bool ToPalette(fipImage &img) {
    if (img.getBitsPerPixel() == 8) {
        return true;
    }
    if (img.getBitsPerPixel() != 24 && !img.convertTo24Bits()) {
        return false;
    }
    return img.colorQuantize(FIQ_WUQUANT);
}

bool To32Bits(fipImage &img) {
    if (img.getBitsPerPixel() == 32) {
        return true;
    }
    return img.convertTo32Bits();
}

// Indexed by Format.
constexpr std::array<Codec, AllFormats.size()> Codecs = {{
    {FIF_JPEG, JPEG_DEFAULT, LossyFlags, To24Bits, nullptr, nullptr, nullptr},
    {FIF_PNG, PNG_DEFAULT, PngFlags, KeepLayout, nullptr, nullptr, nullptr},
    {FIF_GIF, GIF_DEFAULT, nullptr, ToPalette, nullptr, nullptr, nullptr},
    {FIF_WEBP, WEBP_DEFAULT, LossyFlags, KeepLayout, nullptr, nullptr, nullptr},
    {FIF_BMP, BMP_DEFAULT, nullptr, KeepLayout, nullptr, nullptr, nullptr},
    {FIF_UNKNOWN, AvifQuantizer(80), AvifQuantizer, To32Bits, LoadAvif, SaveAvifToMemory, AvifCanEncode},
}};

bool CanEncode(const Codec &codec) {
    if (codec.CanEncode != nullptr) {
        return codec.CanEncode();
    }
    return codec.Fif != FIF_UNKNOWN && FreeImage_FIFSupportsWriting(codec.Fif);
}

// Leaves no partial file behind on failure.
bool WriteFileData(const fs::path &path, const std::vector<uint8_t> &bytes) {
    {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        file.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (file) {
            return true;
        }
    }
    std::error_code ec;
    fs::remove(path, ec);
    return false;
}

int SaveFlags(const Codec &codec, const std::optional<int> quality) {
    if (quality && codec.QualityFlags != nullptr) {
        return codec.QualityFlags(*quality);
    }
    return codec.DefaultFlags;
}

imgconv::Status PrepareForEncode(fipImage &img, const Codec &codec, const Format format) {
    if (!CanEncode(codec)) {
        return imgconv::Fail(imgconv::ErrorKind::Encode, "No encoder available for {}", MimeType(format));
    }
    if (!img.isValid()) {
        return imgconv::Fail(imgconv::ErrorKind::Encode, "Nothing to encode");
    }
    if (!codec.Prepare(img)) {
        return imgconv::Fail(imgconv::ErrorKind::Encode, "Failed to convert {}x{} image ({} bpp) for {}",
                             img.getWidth(), img.getHeight(), img.getBitsPerPixel(), MimeType(format));
    }
    return std::nullopt;
}

} // namespace

const Codec &CodecFor(const Format format) {
    return Codecs[static_cast<size_t>(format)];
}

imgconv::Status Decode(const fs::path &path, const Format format, fipImage &img) {
    const auto &codec = CodecFor(format);
    if (codec.Load != nullptr) {
        if (auto status = codec.Load(path, img)) {
            return status;
        }
    } else if (codec.Fif == FIF_UNKNOWN || !FreeImage_FIFSupportsReading(codec.Fif)) {
        return imgconv::Fail(imgconv::ErrorKind::Format, "No decoder available for {}", MimeType(format));
    } else if (!LoadFipImage(img, codec.Fif, path)) {
        return imgconv::Fail(imgconv::ErrorKind::File, "Failed to load image (while opening: {})", path.string());
    }
    if (img.getImageType() != FIT_BITMAP || img.getBitsPerPixel() != 32) {
        if (!img.convertTo32Bits()) {
            return imgconv::Fail(imgconv::ErrorKind::File, "Failed to convert image to 32bpp (while opening: {})",
                                 path.string());
        }
    }
    spdlog::debug("Decoded {} ({}x{})", path.string(), img.getWidth(), img.getHeight());
    return std::nullopt;
}

imgconv::Status Encode(fipImage &img, const FileSink &sink, const Format format, const std::optional<int> quality) {
    const auto &codec = CodecFor(format);
    if (auto status = PrepareForEncode(img, codec, format)) {
        return status;
    }
    if (codec.SaveToMemory != nullptr) {
        BufferSink buffer;
        if (auto status = codec.SaveToMemory(img, SaveFlags(codec, quality), buffer.Bytes)) {
            return status;
        }
        if (!WriteFileData(sink.Path, buffer.Bytes)) {
            return imgconv::Fail(imgconv::ErrorKind::Encode, "Failed to write {} image (while opening: {})",
                                 MimeType(format), sink.Path.string());
        }
    } else if (!SaveFipImage(img, codec.Fif, sink.Path, SaveFlags(codec, quality))) {
        return imgconv::Fail(imgconv::ErrorKind::Encode, "Failed to save {} image (while opening: {})",
                             MimeType(format), sink.Path.string());
    }
    spdlog::debug("Encoded {} to {}", MimeType(format), sink.Path.string());
    return std::nullopt;
}

imgconv::Status Encode(fipImage &img, BufferSink &sink, const Format format, const std::optional<int> quality) {
    const auto &codec = CodecFor(format);
    if (auto status = PrepareForEncode(img, codec, format)) {
        return status;
    }

    if (codec.SaveToMemory != nullptr) {
        if (auto status = codec.SaveToMemory(img, SaveFlags(codec, quality), sink.Bytes)) {
            return status;
        }
        spdlog::debug("Encoded {} ({} bytes)", MimeType(format), sink.Bytes.size());
        return std::nullopt;
    }

    fipMemoryIO memIO;
    if (!img.saveToMemory(codec.Fif, memIO, SaveFlags(codec, quality))) {
        return imgconv::Fail(imgconv::ErrorKind::Encode, "Failed to encode {} image to memory", MimeType(format));
    }

    BYTE *data = nullptr;
    DWORD size = 0;
    if (!memIO.acquire(&data, &size) || data == nullptr) {
        return imgconv::Fail(imgconv::ErrorKind::Encode, "Failed to acquire encoded {} buffer", MimeType(format));
    }
    sink.Bytes.assign(data, data + size);
    spdlog::debug("Encoded {} ({} bytes)", MimeType(format), size);
    return std::nullopt;
}

} // namespace Image
