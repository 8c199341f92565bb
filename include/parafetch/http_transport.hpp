#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace parafetch {

enum class HttpMethod {
    Head,
    Get,
};

struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    std::string url;
    // Sent as "Range: bytes=<range_start>-[<range_end>]" when set.
    std::optional<std::uint64_t> range_start;
    std::optional<std::uint64_t> range_end;
    // Zero disables the limit.
    std::chrono::milliseconds total_timeout{0};
    std::chrono::milliseconds connect_timeout{0};
    // Abort when no body bytes arrive for this long.
    std::chrono::milliseconds idle_timeout{0};
    std::size_t buffer_size{0};
};

struct HttpResponse {
    long status{0};
    // Keys are lower-case.
    std::map<std::string, std::string> headers;
    std::string effective_url;

    [[nodiscard]] std::optional<std::string> header(const std::string& name) const;
    [[nodiscard]] std::optional<std::uint64_t> contentLength() const;
};

class ResponseHandler {
public:
    virtual ~ResponseHandler() = default;

    // Called once with the final response (after redirects) before any body
    // byte. Returning false stops the transfer without an error.
    virtual bool onHeaders(const HttpResponse& response) = 0;
    virtual void onBody(const char* data, std::size_t size) = 0;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Throws TransportError on network failure. Exceptions thrown by the
    // handler are propagated unchanged.
    virtual HttpResponse perform(const HttpRequest& request, ResponseHandler& handler) = 0;
};

// libcurl session shared by every thread of one run: connections, DNS
// results and TLS sessions are pooled through a share handle.
class CurlTransport final : public HttpTransport {
public:
    CurlTransport();
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse perform(const HttpRequest& request, ResponseHandler& handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parafetch
