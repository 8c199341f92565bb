#pragma once

#include "config.hpp"
#include "http_transport.hpp"
#include "observer.hpp"
#include "progress.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace parafetch {

struct ResourceRequest {
    std::string url;
    // Used instead of the URL's last path segment; sanitized either way.
    std::optional<std::string> filename;
};

struct Outcome {
    TransferStatus status{TransferStatus::Failed};
    std::string url;
    std::string filename;
    std::filesystem::path path;
    std::string error;
    int attempts{0};

    [[nodiscard]] bool succeeded() const noexcept { return status == TransferStatus::Completed; }
};

struct TransferOptions {
    std::size_t chunk_size{8192};
    int max_retries{3};
    std::chrono::duration<double> backoff_base{1.0};
    std::chrono::milliseconds request_timeout{std::chrono::seconds(30)};

    [[nodiscard]] static TransferOptions fromConfig(const FetchConfig& config);
};

using Sleeper = std::function<void(std::chrono::duration<double>)>;

// Fetches one resource: resumes from a partial file, streams in fixed-size
// chunks and retries with exponential backoff. fetch() never throws for
// per-resource failures; they are reported through the returned Outcome.
class TransferEngine {
public:
    // The sleeper is called for every backoff delay; defaults to
    // std::this_thread::sleep_for.
    TransferEngine(HttpTransport& transport, TransferOptions options, Sleeper sleeper = {});
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    [[nodiscard]] Outcome fetch(const ResourceRequest& request,
                                const std::filesystem::path& destination_dir,
                                TransferObserver* observer = nullptr) const;

    // base * 2^(attempt - 1) * jitter, attempt counted from 1.
    [[nodiscard]] static std::chrono::duration<double> backoffDelay(std::chrono::duration<double> base,
                                                                    int attempt,
                                                                    double jitter);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parafetch
