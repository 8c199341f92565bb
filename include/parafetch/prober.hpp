#pragma once

#include "http_transport.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace parafetch {

struct ProbeResult {
    bool downloadable{false};
    std::string reason;
};

// Classifies a URL as a fetchable file or a web page without downloading it:
// HEAD first, then a single-byte ranged GET when HEAD is inconclusive.
class Prober {
public:
    Prober(HttpTransport& transport, std::vector<std::string> blocklist);

    [[nodiscard]] ProbeResult probe(const std::string& url, std::chrono::milliseconds timeout) const;

    // True when host equals an entry or ends with "." + entry.
    [[nodiscard]] bool isBlocked(const std::string& host) const;

private:
    HttpTransport& transport_;
    std::vector<std::string> blocklist_;
};

} // namespace parafetch
