#pragma once

#include "capability.hpp"
#include "format.hpp"
#include "imgconv.hpp"

#include <set>
#include <string>
#include <string_view>

namespace Image {

struct Request {
    Format Source;
    Format Target;
};

imgconv::Status CheckEnvironment();

imgconv::Result<Format> CheckOutputFormat(std::string_view format, const std::set<std::string> &supported);

// Detects the source type from the file signature and reads its header.
imgconv::Result<Format> CheckSource(const fs::path &path, const std::set<std::string> &supported);

// Runs every check in order and stops at the first failure. The capability set is only
// computed once the runtime is known to be available.
imgconv::Result<Request> Validate(const fs::path &path, std::string_view format, CapabilityCache &capabilities);

} // namespace Image
