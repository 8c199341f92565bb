#include "parafetch/http_transport.hpp"

#include "parafetch/detail/curl_utils.hpp"
#include "parafetch/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>

namespace parafetch {

namespace {

constexpr const char* kUserAgent = "parafetch/1.0";
constexpr long kMaxRedirects = 10;

std::string trimWhitespace(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

} // namespace

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    const auto it = headers.find(detail::toLower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::uint64_t> HttpResponse::contentLength() const {
    const auto value = header("content-length");
    if (!value || value->empty() || !std::isdigit(static_cast<unsigned char>(value->front()))) {
        return std::nullopt;
    }
    try {
        return std::stoull(*value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

class CurlTransport::Impl {
public:
    Impl() : share_(nullptr, &curl_share_cleanup) {
        detail::ensureCurlInitialized();

        share_.reset(curl_share_init());
        if (!share_) {
            throw TransportError("Failed to allocate curl share handle");
        }
        curl_share_setopt(share_.get(), CURLSHOPT_LOCKFUNC, &Impl::lockShared);
        curl_share_setopt(share_.get(), CURLSHOPT_UNLOCKFUNC, &Impl::unlockShared);
        curl_share_setopt(share_.get(), CURLSHOPT_USERDATA, this);
        curl_share_setopt(share_.get(), CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        curl_share_setopt(share_.get(), CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
        curl_share_setopt(share_.get(), CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    }

    HttpResponse perform(const HttpRequest& request, ResponseHandler& handler) {
        using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            throw TransportError("Failed to allocate curl handle");
        }

        TransferContext ctx{&handler};
        std::array<char, CURL_ERROR_SIZE> error_buffer{};

        curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_SHARE, share_.get());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, kMaxRedirects);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, kUserAgent);
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer.data());
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &Impl::headerCallback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);

        if (request.method == HttpMethod::Head) {
            curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        }

        std::string range;
        if (request.range_start) {
            range = std::to_string(*request.range_start) + "-";
            if (request.range_end) {
                range += std::to_string(*request.range_end);
            }
            curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
        }

        if (request.total_timeout.count() > 0) {
            curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request.total_timeout.count()));
        }
        if (request.connect_timeout.count() > 0) {
            curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout.count()));
        }
        if (request.idle_timeout.count() > 0) {
            const long seconds = std::max<long>(1, static_cast<long>((request.idle_timeout.count() + 999) / 1000));
            curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, seconds);
        }
        if (request.buffer_size > 0) {
            curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, static_cast<long>(request.buffer_size));
        }

        const CURLcode res = curl_easy_perform(curl.get());

        if (ctx.error) {
            std::rethrow_exception(ctx.error);
        }

        long code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
        if (code != 0) {
            ctx.response.status = code;
        }
        char* effective = nullptr;
        if (curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
            ctx.response.effective_url = effective;
        }

        if (ctx.stopped) {
            return std::move(ctx.response);
        }
        if (res != CURLE_OK) {
            const std::string detail = error_buffer[0] != '\0' ? error_buffer.data() : curl_easy_strerror(res);
            throw TransportError(fmt::format("curl error: {}", detail));
        }

        // Responses without a body (HEAD, empty files) never reach the write callback.
        if (!ctx.headers_delivered) {
            ctx.headers_delivered = true;
            if (!handler.onHeaders(ctx.response)) {
                ctx.stopped = true;
            }
        }
        return std::move(ctx.response);
    }

private:
    struct TransferContext {
        ResponseHandler* handler{nullptr};
        HttpResponse response;
        bool headers_delivered{false};
        bool stopped{false};
        std::exception_ptr error;
    };

    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* ctx = static_cast<TransferContext*>(userdata);
        const size_t total = size * nitems;
        if (!ctx) {
            return 0;
        }

        const std::string line = trimWhitespace(std::string(buffer, total));
        if (line.compare(0, 5, "HTTP/") == 0) {
            // Each redirect hop or interim response starts a new header block.
            ctx->response.headers.clear();
            ctx->response.status = 0;
            const auto space = line.find(' ');
            if (space != std::string::npos) {
                try {
                    ctx->response.status = std::stol(line.substr(space + 1, 3));
                } catch (const std::exception&) {
                    ctx->response.status = 0;
                }
            }
            return total;
        }

        const auto colon = line.find(':');
        if (colon != std::string::npos) {
            ctx->response.headers[detail::toLower(trimWhitespace(line.substr(0, colon)))] =
                trimWhitespace(line.substr(colon + 1));
        }
        return total;
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<TransferContext*>(userdata);
        const size_t total = size * nmemb;
        if (!ctx || !ctx->handler) {
            return 0;
        }

        const long status = ctx->response.status;
        if (status >= 300 && status < 400 && ctx->response.headers.count("location") != 0) {
            return total;
        }

        try {
            if (!ctx->headers_delivered) {
                ctx->headers_delivered = true;
                if (!ctx->handler->onHeaders(ctx->response)) {
                    ctx->stopped = true;
                    return 0;
                }
            }
            ctx->handler->onBody(ptr, total);
        } catch (...) {
            ctx->error = std::current_exception();
            return 0;
        }
        return total;
    }

    static void lockShared(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        static_cast<Impl*>(userptr)->locks_[static_cast<std::size_t>(data)].lock();
    }

    static void unlockShared(CURL*, curl_lock_data data, void* userptr) {
        static_cast<Impl*>(userptr)->locks_[static_cast<std::size_t>(data)].unlock();
    }

    std::array<std::mutex, static_cast<std::size_t>(CURL_LOCK_DATA_LAST)> locks_;
    std::unique_ptr<CURLSH, decltype(&curl_share_cleanup)> share_;
};

CurlTransport::CurlTransport() : impl_(std::make_unique<Impl>()) {}

CurlTransport::~CurlTransport() = default;

HttpResponse CurlTransport::perform(const HttpRequest& request, ResponseHandler& handler) {
    return impl_->perform(request, handler);
}

} // namespace parafetch
