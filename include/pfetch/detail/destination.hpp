#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>

namespace pfetch::detail {

// Last path segment of the URL with query and fragment removed and percent
// escapes decoded. Empty when the URL has no usable segment.
std::string filenameFromUrl(const std::string& url);

// "download_<n>"
std::string fallbackFilename(std::size_t sequence);

// Returns candidate, or the first of "stem__1.ext", "stem__2.ext", ... for
// which is_taken returns false.
std::filesystem::path uniquePath(const std::filesystem::path& candidate,
                                 const std::function<bool(const std::filesystem::path&)>& is_taken);

} // namespace pfetch::detail
