#include "image.hpp"
#include "avif.hpp"
#include "capability.hpp"
#include "codec.hpp"
#include "format.hpp"
#include "transform.hpp"
#include "utils.hpp"
#include "validate.hpp"

#include <mutex>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

std::vector<std::string> QueryCapabilities() {
    auto reported = Image::QueryFreeImageCapabilities();
    const auto avif = Image::QueryAvifCapabilities();
    reported.insert(reported.end(), avif.begin(), avif.end());
    return reported;
}

Image::CapabilityCache &ProcessCapabilities() {
    static Image::CapabilityCache cache(QueryCapabilities);
    return cache;
}

struct Prepared {
    Image::Format Target;
    std::optional<int> Quality;
};

// Validates the request, then decodes and transforms the source into img.
Prepared LoadAndPrepare(fipImage &img, const fs::path &srcPath, const std::string_view format, const int quality,
                        const int width, const int height) {
    const auto request = imgconv::Unwrap(Image::Validate(srcPath, format, ProcessCapabilities()));
    const auto mapped = Image::MapQuality(quality, request.Target);
    if (mapped) {
        spdlog::debug("Quality {} -> {} for {}", quality, *mapped, Image::MimeType(request.Target));
    }

    imgconv::Check(Image::Decode(srcPath, request.Source, img));
    if (Image::WantsResize(width, height)) {
        imgconv::Check(Image::ResizeCover(img, width, height));
    }
    return {request.Target, mapped};
}

} // namespace

void Image::Initialize() {
    static std::once_flag once;
    std::call_once(once, [] {
        FreeImage_Initialise();
        FreeImage_SetOutputMessage([](const FREE_IMAGE_FORMAT fif, const char *msg) {
            const char *name = fif != FIF_UNKNOWN ? FreeImage_GetFormatFromFIF(fif) : "FreeImage";
            spdlog::error("[{}] {}", name != nullptr ? name : "FreeImage", msg);
        });
    });
}

const std::set<std::string> &Image::GetSupportedFormats() {
    return ProcessCapabilities().Get();
}

void Image::EnsureValid(const fs::path &srcPath) {
    imgconv::Check(CheckEnvironment());
    imgconv::Unwrap(CheckSource(srcPath, GetSupportedFormats()));
}

std::string Image::ConvertToBase64(const fs::path &srcPath, const std::string_view format, const int quality,
                                   const int width, const int height) {
    BufferSink sink;
    Format target;
    {
        fipImage img;
        const auto prepared = LoadAndPrepare(img, srcPath, format, quality, width, height);
        target = prepared.Target;
        imgconv::Check(Encode(img, sink, target, prepared.Quality));
    }
    return fmt::format("data:{};base64,{}", MimeType(target), Base64Encode(sink.Bytes));
}

void Image::ConvertToDisk(const fs::path &srcPath, const fs::path &dstPath, const std::string_view format,
                          const int quality, const int width, const int height) {
    fipImage img;
    const auto prepared = LoadAndPrepare(img, srcPath, format, quality, width, height);
    imgconv::Check(Encode(img, FileSink{dstPath}, prepared.Target, prepared.Quality));
    spdlog::debug("Saved {} as {}", dstPath.string(), MimeType(prepared.Target));
}
