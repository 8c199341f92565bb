#include "parafetch/detail/curl_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <stdexcept>

#include <curl/curl.h>

namespace parafetch::detail {

namespace {

using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

std::string urlPart(const std::string& url, CURLUPart part) {
    UrlHandle handle{curl_url(), &curl_url_cleanup};
    if (!handle) {
        return {};
    }
    if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), CURLU_DEFAULT_SCHEME) != CURLUE_OK) {
        return {};
    }

    char* value = nullptr;
    if (curl_url_get(handle.get(), part, &value, 0) != CURLUE_OK || !value) {
        return {};
    }
    std::string result{value};
    curl_free(value);
    return result;
}

} // namespace

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

std::string urlHost(const std::string& url) {
    return toLower(urlPart(url, CURLUPART_HOST));
}

std::string urlLastSegment(const std::string& url) {
    std::string path = urlPart(url, CURLUPART_PATH);
    if (path.empty()) {
        // Not a URL libcurl accepts; cut query and fragment by hand.
        path = url.substr(0, url.find_first_of("?#"));
    }

    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string percentDecode(std::string_view text) {
    if (text.empty()) {
        return {};
    }

    int length = 0;
    char* decoded = curl_easy_unescape(nullptr, text.data(), static_cast<int>(text.size()), &length);
    if (!decoded) {
        return std::string{text};
    }
    std::string result(decoded, static_cast<std::size_t>(length));
    curl_free(decoded);
    return result;
}

std::string toLower(std::string_view text) {
    std::string result{text};
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace parafetch::detail
