#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace parafetch {

// Percent-decodes, then strips path separators, control and reserved
// characters and surrounding whitespace/dots. Never returns an empty string:
// degenerate input yields randomFallbackName().
[[nodiscard]] std::string sanitizeFilename(std::string_view raw);

[[nodiscard]] std::string filenameFromUrl(const std::string& url);

// "download_" followed by 8 hex digits.
[[nodiscard]] std::string randomFallbackName();

[[nodiscard]] bool isDirectChild(const std::filesystem::path& directory, const std::filesystem::path& candidate);

// Joins name to directory; falls back to a random name if the result would
// not be a direct child of directory.
[[nodiscard]] std::filesystem::path resolveDestination(const std::filesystem::path& directory,
                                                       const std::string& name);

} // namespace parafetch
