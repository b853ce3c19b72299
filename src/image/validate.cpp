#include "validate.hpp"
#include "avif.hpp"
#include "codec.hpp"
#include "utils.hpp"

#include <system_error>

#include <spdlog/spdlog.h>

namespace Image {

namespace {

std::optional<Format> FormatFromFif(const FREE_IMAGE_FORMAT fif) {
    for (const auto format : AllFormats) {
        if (CodecFor(format).Fif != FIF_UNKNOWN && CodecFor(format).Fif == fif) {
            return format;
        }
    }
    return std::nullopt;
}

} // namespace

imgconv::Status CheckEnvironment() {
    if (FreeImage_GetFIFCount() <= 0) {
        return imgconv::Fail(imgconv::ErrorKind::Environment, "FreeImage {} has no registered plugins",
                             FreeImage_GetVersion());
    }
    return std::nullopt;
}

imgconv::Result<Format> CheckOutputFormat(const std::string_view format, const std::set<std::string> &supported) {
    auto target = ParseFormat(format);
    if (imgconv::Ok(target) && !supported.contains(MimeType(std::get<Format>(target)))) {
        return imgconv::Fail(imgconv::ErrorKind::Format, "Format not supported: {}", NormalizeMime(format));
    }
    return target;
}

imgconv::Result<Format> CheckSource(const fs::path &path, const std::set<std::string> &supported) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return imgconv::Fail(imgconv::ErrorKind::File, "File does not exist (while opening: {})", path.string());
    }

    // FreeImage has no AVIF plugin, libavif reads those headers.
    if (IsAvifFile(path)) {
        const auto dims = AvifDimensions(path);
        if (!dims || dims->first == 0 || dims->second == 0) {
            return imgconv::Fail(imgconv::ErrorKind::File, "Not a valid image file (while opening: {})",
                                 path.string());
        }
        if (!supported.contains(MimeType(Format::Avif))) {
            return imgconv::Fail(imgconv::ErrorKind::Format, "File type is not supported: {}", MimeType(Format::Avif));
        }
        spdlog::debug("Detected {} ({}x{}) for {}", MimeType(Format::Avif), dims->first, dims->second, path.string());
        return Format::Avif;
    }

    const auto fif = GetFreeImageFormat(path);
    fipImage header;
    if (fif == FIF_UNKNOWN || !LoadFipImage(header, fif, path, FIF_LOAD_NOPIXELS) || header.getWidth() == 0 ||
        header.getHeight() == 0) {
        return imgconv::Fail(imgconv::ErrorKind::File, "Not a valid image file (while opening: {})", path.string());
    }

    const auto source = FormatFromFif(fif);
    if (!source || !supported.contains(MimeType(*source))) {
        const char *mime = FreeImage_GetFIFMimeType(fif);
        return imgconv::Fail(imgconv::ErrorKind::Format, "File type is not supported: {}",
                             mime != nullptr ? mime : FreeImage_GetFormatFromFIF(fif));
    }
    spdlog::debug("Detected {} ({}x{}) for {}", MimeType(*source), header.getWidth(), header.getHeight(),
                  path.string());
    return *source;
}

imgconv::Result<Request> Validate(const fs::path &path, const std::string_view format,
                                  CapabilityCache &capabilities) {
    if (auto status = CheckEnvironment()) {
        return *status;
    }

    const auto &supported = capabilities.Get();

    auto target = CheckOutputFormat(format, supported);
    if (const auto *failure = std::get_if<imgconv::Failure>(&target)) {
        return *failure;
    }

    auto source = CheckSource(path, supported);
    if (const auto *failure = std::get_if<imgconv::Failure>(&source)) {
        return *failure;
    }
    return Request{std::get<Format>(source), std::get<Format>(target)};
}

} // namespace Image
