#include "parafetch/prober.hpp"

#include "parafetch/detail/curl_utils.hpp"
#include "parafetch/errors.hpp"
#include "parafetch/logging.hpp"

#include <optional>
#include <utility>

#include <fmt/format.h>

namespace parafetch {

namespace {

// Records the headers and declines the body.
class HeaderOnlyHandler final : public ResponseHandler {
public:
    bool onHeaders(const HttpResponse&) override { return false; }
    void onBody(const char*, std::size_t) override {}
};

bool isHtml(const std::string& content_type) {
    const auto mime = detail::toLower(content_type.substr(0, content_type.find(';')));
    return mime.find("text/html") != std::string::npos;
}

// Header rules shared by both phases. Empty when the headers decide nothing.
std::optional<ProbeResult> classify(const HttpResponse& response, bool accept_length) {
    if (response.header("content-disposition")) {
        return ProbeResult{true, "content-disposition"};
    }
    if (accept_length && response.header("content-length")) {
        return ProbeResult{true, "content-length"};
    }
    if (auto type = response.header("content-type")) {
        if (!isHtml(*type)) {
            return ProbeResult{true, fmt::format("content-type: {}", *type)};
        }
    }
    return std::nullopt;
}

bool headDisallowed(long status) {
    return status == 405 || status == 501;
}

} // namespace

Prober::Prober(HttpTransport& transport, std::vector<std::string> blocklist)
    : transport_(transport) {
    blocklist_.reserve(blocklist.size());
    for (auto& entry : blocklist) {
        auto domain = detail::toLower(entry);
        while (!domain.empty() && domain.front() == '.') {
            domain.erase(domain.begin());
        }
        if (!domain.empty()) {
            blocklist_.push_back(std::move(domain));
        }
    }
}

bool Prober::isBlocked(const std::string& host) const {
    const auto lowered = detail::toLower(host);
    for (const auto& domain : blocklist_) {
        if (lowered == domain) {
            return true;
        }
        if (lowered.size() > domain.size() &&
            lowered.compare(lowered.size() - domain.size(), domain.size(), domain) == 0 &&
            lowered[lowered.size() - domain.size() - 1] == '.') {
            return true;
        }
    }
    return false;
}

ProbeResult Prober::probe(const std::string& url, std::chrono::milliseconds timeout) const {
    if (isBlocked(detail::urlHost(url))) {
        logger()->info("probe url={} status=blocked", url);
        return {false, "blocked host"};
    }

    HttpRequest head;
    head.method = HttpMethod::Head;
    head.url = url;
    head.total_timeout = timeout;

    try {
        HeaderOnlyHandler handler;
        const auto response = transport_.perform(head, handler);
        if (response.status >= 400 && !headDisallowed(response.status)) {
            return {false, fmt::format("HTTP {}", response.status)};
        }
        if (response.status < 400) {
            if (auto verdict = classify(response, true)) {
                return *verdict;
            }
        }
        logger()->debug("probe url={} inconclusive head status={}", url, response.status);
    } catch (const TransportError& e) {
        logger()->debug("probe url={} head failed error={}", url, e.what());
    }

    HttpRequest get;
    get.method = HttpMethod::Get;
    get.url = url;
    get.range_start = 0;
    get.range_end = 0;
    get.total_timeout = timeout;

    try {
        HeaderOnlyHandler handler;
        const auto response = transport_.perform(get, handler);
        if (response.status >= 400) {
            return {false, fmt::format("HTTP {}", response.status)};
        }
        if (auto verdict = classify(response, false)) {
            return *verdict;
        }
        return {false, "html page"};
    } catch (const TransportError& e) {
        logger()->info("probe url={} error={}", url, e.what());
        return {false, e.what()};
    }
}

} // namespace parafetch
