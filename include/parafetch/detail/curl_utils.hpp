#pragma once

#include <string>
#include <string_view>

namespace parafetch::detail {

void ensureCurlInitialized();

// Host part of an absolute URL, lower-cased. Empty when the URL does not parse.
[[nodiscard]] std::string urlHost(const std::string& url);

// Last segment of the URL path, still percent-encoded. Query and fragment are
// never part of it.
[[nodiscard]] std::string urlLastSegment(const std::string& url);

[[nodiscard]] std::string percentDecode(std::string_view text);

[[nodiscard]] std::string toLower(std::string_view text);

} // namespace parafetch::detail
