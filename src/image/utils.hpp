#pragma once

#include "imgconv.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

#include <FreeImagePlus.h>

namespace Image {

// Signature based, the file extension is never consulted.
inline FREE_IMAGE_FORMAT GetFreeImageFormat(const fs::path &path) {
#ifdef _WIN32
    return FreeImage_GetFileTypeU(path.c_str());
#else
    return FreeImage_GetFileType(path.c_str());
#endif
}

inline bool LoadFipImage(fipImage &img, const FREE_IMAGE_FORMAT fif, const fs::path &path, const int flags = 0) {
#ifdef _WIN32
    FIBITMAP *dib = FreeImage_LoadU(fif, path.c_str(), flags);
#else
    FIBITMAP *dib = FreeImage_Load(fif, path.c_str(), flags);
#endif
    if (dib == nullptr) {
        return false;
    }
    img = dib;
    return true;
}

inline bool SaveFipImage(fipImage &img, const FREE_IMAGE_FORMAT fif, const fs::path &path, const int flags) {
#ifdef _WIN32
    return FreeImage_SaveU(fif, img, path.c_str(), flags) == TRUE;
#else
    return FreeImage_Save(fif, img, path.c_str(), flags) == TRUE;
#endif
}

inline std::string Base64Encode(const std::span<const uint8_t> data) {
    static constexpr char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        const uint32_t n = data[i] << 16 | data[i + 1] << 8 | data[i + 2];
        out.push_back(alphabet[n >> 18 & 0x3F]);
        out.push_back(alphabet[n >> 12 & 0x3F]);
        out.push_back(alphabet[n >> 6 & 0x3F]);
        out.push_back(alphabet[n & 0x3F]);
    }

    if (const size_t rest = data.size() - i; rest > 0) {
        uint32_t n = data[i] << 16;
        if (rest == 2) {
            n |= data[i + 1] << 8;
        }
        out.push_back(alphabet[n >> 18 & 0x3F]);
        out.push_back(alphabet[n >> 12 & 0x3F]);
        out.push_back(rest == 2 ? alphabet[n >> 6 & 0x3F] : '=');
        out.push_back('=');
    }
    return out;
}

} // namespace Image
