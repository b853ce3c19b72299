#include "transform.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

namespace Image {

imgconv::Result<CoverPlan> CoverGeometry(const unsigned srcWidth, const unsigned srcHeight, const int width,
                                         const int height) {
    if (srcWidth == 0 || srcHeight == 0) {
        return imgconv::Fail(imgconv::ErrorKind::Transform, "Failed to crop image: source is {}x{}", srcWidth,
                             srcHeight);
    }
    if (!WantsResize(width, height)) {
        return imgconv::Fail(imgconv::ErrorKind::Transform, "Failed to crop image: target is {}x{}", width, height);
    }

    CoverPlan plan;
    plan.Width = static_cast<unsigned>(width);
    plan.Height = static_cast<unsigned>(height);
    plan.Scale = std::max(static_cast<double>(width) / srcWidth, static_cast<double>(height) / srcHeight);

    const double scaledWidth = std::ceil(srcWidth * plan.Scale);
    const double scaledHeight = std::ceil(srcHeight * plan.Scale);
    if (scaledWidth > MaxDimension || scaledHeight > MaxDimension) {
        return imgconv::Fail(imgconv::ErrorKind::Transform, "Failed to resize image: {:.0f}x{:.0f} exceeds {} pixels",
                             scaledWidth, scaledHeight, MaxDimension);
    }

    // Rounding can leave a scaled side one pixel short of the box; never crop outside the bitmap.
    plan.ScaledWidth = std::max(static_cast<unsigned>(scaledWidth), plan.Width);
    plan.ScaledHeight = std::max(static_cast<unsigned>(scaledHeight), plan.Height);

    plan.X = std::clamp((plan.ScaledWidth - plan.Width) / 2, 0u, plan.ScaledWidth - plan.Width);
    plan.Y = std::clamp((plan.ScaledHeight - plan.Height) / 2, 0u, plan.ScaledHeight - plan.Height);
    return plan;
}

imgconv::Status ResizeCover(fipImage &img, const int width, const int height) {
    auto geometry = CoverGeometry(img.getWidth(), img.getHeight(), width, height);
    if (const auto *failure = std::get_if<imgconv::Failure>(&geometry)) {
        return *failure;
    }
    const auto &plan = std::get<CoverPlan>(geometry);

    spdlog::debug("Cover {}x{} -> {}x{} (scale {:.4f}), crop {}x{} at ({}, {})", img.getWidth(), img.getHeight(),
                  plan.ScaledWidth, plan.ScaledHeight, plan.Scale, plan.Width, plan.Height, plan.X, plan.Y);

    if (!img.rescale(plan.ScaledWidth, plan.ScaledHeight, FILTER_BICUBIC)) {
        return imgconv::Fail(imgconv::ErrorKind::Transform, "Failed to rescale image to {}x{}", plan.ScaledWidth,
                             plan.ScaledHeight);
    }

    const auto left = static_cast<int>(plan.X);
    const auto top = static_cast<int>(plan.Y);
    if (!img.crop(left, top, left + static_cast<int>(plan.Width), top + static_cast<int>(plan.Height))) {
        return imgconv::Fail(imgconv::ErrorKind::Transform, "Failed to crop image");
    }
    if (img.getWidth() != plan.Width || img.getHeight() != plan.Height) {
        return imgconv::Fail(imgconv::ErrorKind::Transform, "Failed to crop image: got {}x{}, expected {}x{}",
                             img.getWidth(), img.getHeight(), plan.Width, plan.Height);
    }
    return std::nullopt;
}

} // namespace Image
