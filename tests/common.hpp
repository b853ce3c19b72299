#pragma once

#ifdef WIN32
#define _CRTDBG_MAP_ALLOC
#include <stdlib.h>
#include <crtdbg.h>
#define CATCH_CONFIG_WINDOWS_CRTDBG
#endif

#include <algorithm>
#include <catch2/catch_all.hpp>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include "imgconv.hpp"
#include "tests/asset.h"

inline fs::path GetPath(const std::wstring& filename, const std::wstring& subdir = L"") {
    auto base = fs::path(TEST_ASSET_DIR) / subdir;
    return filename.empty() ? base : base / filename;
}

inline fs::path GetInputPath(const std::wstring& filename = L"") {
    return GetPath(filename);
}

inline fs::path GetOutputPath(const std::wstring& filename = L"") {
    return GetPath(filename, L"tmp");
}

inline void Setup()
{
#ifdef WIN32
    _CrtSetDbgFlag(_CRTDBG_ALLOC_MEM_DF | _CRTDBG_LEAK_CHECK_DF);
#endif

    if (const fs::path tmp = GetOutputPath(); !std::filesystem::exists(tmp))
    {
        std::filesystem::create_directories(tmp);
    }
}

inline std::vector<uint8_t> ReadFileData(const fs::path &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw imgconv::FileError(path, "Failed to open file");
    }
    return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
}

inline std::vector<uint8_t> DecodeBase64(const std::string_view text) {
    auto value = [](const char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    };

    std::vector<uint8_t> out;
    uint32_t acc = 0;
    int bits = 0;
    for (const char c : text) {
        if (c == '=') {
            break;
        }
        const int v = value(c);
        if (v < 0) {
            throw std::invalid_argument("invalid base64 character");
        }
        acc = acc << 6 | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>(acc >> bits & 0xFF));
        }
    }
    return out;
}

inline bool StartsWith(const std::vector<uint8_t>& data, const std::string_view magic, const size_t offset = 0) {
    if (data.size() < offset + magic.size()) {
        return false;
    }
    return std::equal(magic.begin(), magic.end(), data.begin() + static_cast<std::ptrdiff_t>(offset),
                      [](const char a, const uint8_t b) { return static_cast<uint8_t>(a) == b; });
}
