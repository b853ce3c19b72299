#pragma once

#include "imgconv.hpp"

#include <limits>

#include <FreeImagePlus.h>

namespace Image {

// Largest side a resampled bitmap may have; crop coordinates are ints.
inline constexpr unsigned MaxDimension = std::numeric_limits<int>::max();

// Resample-then-crop plan that fills the target box without letterboxing.
struct CoverPlan {
    double Scale = 0.0;
    unsigned ScaledWidth = 0;
    unsigned ScaledHeight = 0;
    unsigned X = 0;
    unsigned Y = 0;
    unsigned Width = 0;
    unsigned Height = 0;
};

// Both dimensions must be positive, otherwise the image is left untouched.
inline bool WantsResize(const int width, const int height) {
    return width > 0 && height > 0;
}

imgconv::Result<CoverPlan> CoverGeometry(unsigned srcWidth, unsigned srcHeight, int width, int height);

imgconv::Status ResizeCover(fipImage &img, int width, int height);

} // namespace Image
