#pragma once

#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace Image {

// Returns the raw capability report of the graphics library, one entry per capability.
using CapabilityQuery = std::function<std::vector<std::string>()>;

std::vector<std::string> QueryFreeImageCapabilities();

// Derives "image/<name>" from each reported capability and keeps the allow-listed ones.
std::set<std::string> FilterCapabilities(const std::vector<std::string> &reported);

class CapabilityCache {
public:
    explicit CapabilityCache(CapabilityQuery query) : m_query(std::move(query)) {}

    CapabilityCache(const CapabilityCache &) = delete;
    CapabilityCache &operator=(const CapabilityCache &) = delete;

    // The query runs on the first call only.
    [[nodiscard]] const std::set<std::string> &Get();

private:
    CapabilityQuery m_query;
    std::once_flag m_once;
    std::set<std::string> m_formats;
};

} // namespace Image
