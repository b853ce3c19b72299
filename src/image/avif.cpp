#include "avif.hpp"

#include <array>
#include <cstring>
#include <fstream>
#include <memory>

#include <spdlog/spdlog.h>

namespace Image {

namespace {

struct AvifDecoderDeleter {
    void operator()(avifDecoder *decoder) const { avifDecoderDestroy(decoder); }
};

struct AvifEncoderDeleter {
    void operator()(avifEncoder *encoder) const { avifEncoderDestroy(encoder); }
};

struct AvifImageDeleter {
    void operator()(avifImage *image) const { avifImageDestroy(image); }
};

using AvifDecoderPtr = std::unique_ptr<avifDecoder, AvifDecoderDeleter>;
using AvifEncoderPtr = std::unique_ptr<avifEncoder, AvifEncoderDeleter>;
using AvifImagePtr = std::unique_ptr<avifImage, AvifImageDeleter>;

// Owns the pixel buffer of an avifRGBImage.
class RgbPixels {
public:
    explicit RgbPixels(const avifImage *image) {
        avifRGBImageSetDefaults(&m_rgb, image);
#if FREEIMAGE_COLORORDER == FREEIMAGE_COLORORDER_BGR
        m_rgb.format = AVIF_RGB_FORMAT_BGRA;
#else
        m_rgb.format = AVIF_RGB_FORMAT_RGBA;
#endif
        m_rgb.depth = 8;
    }

    ~RgbPixels() {
        avifRGBImageFreePixels(&m_rgb);
    }

    RgbPixels(const RgbPixels &) = delete;
    RgbPixels &operator=(const RgbPixels &) = delete;

    [[nodiscard]] avifResult Allocate() {
        return avifRGBImageAllocatePixels(&m_rgb);
    }

    avifRGBImage &get() {
        return m_rgb;
    }

    // FreeImage stores rows bottom-up.
    uint8_t *Row(const unsigned y) {
        return m_rgb.pixels + static_cast<size_t>(m_rgb.height - 1 - y) * m_rgb.rowBytes;
    }

private:
    avifRGBImage m_rgb{};
};

AvifDecoderPtr OpenDecoder(const fs::path &path) {
    AvifDecoderPtr decoder(avifDecoderCreate());
    if (!decoder) {
        return nullptr;
    }
    if (avifDecoderSetIOFile(decoder.get(), path.string().c_str()) != AVIF_RESULT_OK) {
        return nullptr;
    }
    const auto result = avifDecoderParse(decoder.get());
    if (result != AVIF_RESULT_OK) {
        spdlog::debug("libavif: failed to parse {} ({})", path.string(), avifResultToString(result));
        return nullptr;
    }
    return decoder;
}

} // namespace

bool AvifCanDecode() {
    return avifCodecName(AVIF_CODEC_CHOICE_AUTO, AVIF_CODEC_FLAG_CAN_DECODE) != nullptr;
}

bool AvifCanEncode() {
    return avifCodecName(AVIF_CODEC_CHOICE_AUTO, AVIF_CODEC_FLAG_CAN_ENCODE) != nullptr;
}

std::vector<std::string> QueryAvifCapabilities() {
    if (!AvifCanDecode() && !AvifCanEncode()) {
        return {};
    }
    return {"image/avif"};
}

bool IsAvifFile(const fs::path &path) {
    std::ifstream file(path, std::ios::binary);
    std::array<char, 12> head{};
    if (!file.read(head.data(), head.size())) {
        return false;
    }
    return std::memcmp(head.data() + 4, "ftyp", 4) == 0 &&
           (std::memcmp(head.data() + 8, "avif", 4) == 0 || std::memcmp(head.data() + 8, "avis", 4) == 0);
}

std::optional<std::pair<unsigned, unsigned>> AvifDimensions(const fs::path &path) {
    const auto decoder = OpenDecoder(path);
    if (!decoder || decoder->image == nullptr) {
        return std::nullopt;
    }
    return std::pair{decoder->image->width, decoder->image->height};
}

imgconv::Status LoadAvif(const fs::path &path, fipImage &img) {
    const auto decoder = OpenDecoder(path);
    if (!decoder) {
        return imgconv::Fail(imgconv::ErrorKind::File, "Failed to parse AVIF image (while opening: {})",
                             path.string());
    }
    if (const auto result = avifDecoderNextImage(decoder.get()); result != AVIF_RESULT_OK) {
        return imgconv::Fail(imgconv::ErrorKind::File, "Failed to decode AVIF image: {} (while opening: {})",
                             avifResultToString(result), path.string());
    }

    RgbPixels rgb(decoder->image);
    if (rgb.Allocate() != AVIF_RESULT_OK) {
        return imgconv::Fail(imgconv::ErrorKind::File, "Failed to allocate {}x{} AVIF pixels", rgb.get().width,
                             rgb.get().height);
    }
    if (const auto result = avifImageYUVToRGB(decoder->image, &rgb.get()); result != AVIF_RESULT_OK) {
        return imgconv::Fail(imgconv::ErrorKind::File, "Failed to convert AVIF image to RGB: {} (while opening: {})",
                             avifResultToString(result), path.string());
    }

    const unsigned width = rgb.get().width;
    const unsigned height = rgb.get().height;
    if (!img.setSize(FIT_BITMAP, width, height, 32)) {
        return imgconv::Fail(imgconv::ErrorKind::File, "Failed to allocate {}x{} bitmap", width, height);
    }
    for (unsigned y = 0; y < height; ++y) {
        std::memcpy(img.getScanLine(y), rgb.Row(y), static_cast<size_t>(width) * 4);
    }
    return std::nullopt;
}

imgconv::Status SaveAvifToMemory(fipImage &img, const int quantizer, std::vector<uint8_t> &bytes) {
    const unsigned width = img.getWidth();
    const unsigned height = img.getHeight();
    if (img.getBitsPerPixel() != 32) {
        return imgconv::Fail(imgconv::ErrorKind::Encode, "AVIF encoder expects 32 bpp, got {}",
                             img.getBitsPerPixel());
    }

    AvifImagePtr image(avifImageCreate(width, height, 8, AVIF_PIXEL_FORMAT_YUV444));
    if (!image) {
        return imgconv::Fail(imgconv::ErrorKind::Encode, "Failed to create {}x{} AVIF image", width, height);
    }

    RgbPixels rgb(image.get());
    if (rgb.Allocate() != AVIF_RESULT_OK) {
        return imgconv::Fail(imgconv::ErrorKind::Encode, "Failed to allocate {}x{} AVIF pixels", width, height);
    }
    for (unsigned y = 0; y < height; ++y) {
        std::memcpy(rgb.Row(y), img.getScanLine(y), static_cast<size_t>(width) * 4);
    }
    if (const auto result = avifImageRGBToYUV(image.get(), &rgb.get()); result != AVIF_RESULT_OK) {
        return imgconv::Fail(imgconv::ErrorKind::Encode, "Failed to convert RGB to YUV: {}",
                             avifResultToString(result));
    }

    AvifEncoderPtr encoder(avifEncoderCreate());
    if (!encoder) {
        return imgconv::Fail(imgconv::ErrorKind::Encode, "Failed to create AVIF encoder");
    }
    encoder->minQuantizer = quantizer;
    encoder->maxQuantizer = quantizer;
    encoder->minQuantizerAlpha = quantizer;
    encoder->maxQuantizerAlpha = quantizer;
    encoder->speed = AVIF_SPEED_FASTEST;

    avifRWData output = AVIF_DATA_EMPTY;
    const auto result = avifEncoderWrite(encoder.get(), image.get(), &output);
    if (result != AVIF_RESULT_OK) {
        avifRWDataFree(&output);
        return imgconv::Fail(imgconv::ErrorKind::Encode, "Failed to encode AVIF image: {}",
                             avifResultToString(result));
    }
    bytes.assign(output.data, output.data + output.size);
    avifRWDataFree(&output);
    return std::nullopt;
}

} // namespace Image
