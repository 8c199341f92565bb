#include "parafetch/transfer_engine.hpp"

#include "parafetch/errors.hpp"
#include "parafetch/filename_sanitizer.hpp"
#include "parafetch/logging.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/format.h>

namespace parafetch {

namespace {

struct ContentRange {
    std::optional<std::uint64_t> first_byte;
    std::optional<std::uint64_t> complete_length;
};

// "bytes 4-9/10" or "bytes */10".
ContentRange parseContentRange(const std::string& value) {
    ContentRange range;
    const auto space = value.find(' ');
    const auto slash = value.find('/');
    if (space == std::string::npos || slash == std::string::npos || slash < space) {
        return range;
    }

    const auto spec = value.substr(space + 1, slash - space - 1);
    const auto length = value.substr(slash + 1);
    try {
        if (spec != "*") {
            range.first_byte = std::stoull(spec.substr(0, spec.find('-')));
        }
        if (length != "*") {
            range.complete_length = std::stoull(length);
        }
    } catch (const std::exception&) {
        return {};
    }
    return range;
}

std::uint64_t sizeOnDisk(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return 0;
    }
    const auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}

double randomJitter() {
    thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.8, 1.2);
    return dist(engine);
}

} // namespace

TransferOptions TransferOptions::fromConfig(const FetchConfig& config) {
    TransferOptions options;
    options.chunk_size = config.chunk_size;
    options.max_retries = config.max_retries;
    options.backoff_base = config.backoff_base;
    options.request_timeout = config.request_timeout;
    return options;
}

class TransferEngine::Impl {
public:
    Impl(HttpTransport& transport, TransferOptions options, Sleeper sleeper)
        : transport_(transport),
          options_(std::move(options)),
          sleeper_(std::move(sleeper)) {
        options_.chunk_size = std::max<std::size_t>(1, options_.chunk_size);
        options_.max_retries = std::max(0, options_.max_retries);
        if (!sleeper_) {
            sleeper_ = [](std::chrono::duration<double> delay) { std::this_thread::sleep_for(delay); };
        }
    }

    Outcome fetch(const ResourceRequest& request,
                  const std::filesystem::path& destination_dir,
                  TransferObserver* observer) const {
        const auto name = request.filename ? sanitizeFilename(*request.filename) : filenameFromUrl(request.url);

        TransferState state;
        state.destination = resolveDestination(destination_dir, name);
        state.filename = state.destination.filename().string();

        Outcome outcome;
        outcome.url = request.url;
        outcome.filename = state.filename;

        for (int attempt = 1;; ++attempt) {
            outcome.attempts = attempt;
            state.local_size = sizeOnDisk(state.destination);

            try {
                logger()->info("transfer attempt url={} filename={} attempt={} bytes={}",
                               request.url, state.filename, attempt, state.local_size);
                runAttempt(request.url, state, observer);

                logger()->info("transfer completed url={} filename={} attempt={} bytes={}",
                               request.url, state.filename, attempt, sizeOnDisk(state.destination));
                outcome.status = TransferStatus::Completed;
                outcome.path = state.destination;
                return outcome;
            } catch (const std::exception& e) {
                logger()->warn("transfer attempt failed url={} filename={} attempt={} error={}",
                               request.url, state.filename, attempt, e.what());

                // The partial file stays on disk so a later run can resume it.
                if (attempt > options_.max_retries) {
                    logger()->error("transfer failed url={} filename={} attempt={} error={}",
                                    request.url, state.filename, attempt, e.what());
                    outcome.status = TransferStatus::Failed;
                    outcome.error = e.what();
                    return outcome;
                }
                sleeper_(backoffDelay(options_.backoff_base, attempt, randomJitter()));
            }
        }
    }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    struct TransferState {
        std::string filename;
        std::filesystem::path destination;
        std::uint64_t local_size{0};
        // Highest byte count reported to the observer so far.
        std::uint64_t reported_bytes{0};
    };

    // Receives one response: decides between resume and restart, then writes
    // the body in chunk_size pieces.
    class AttemptWriter final : public ResponseHandler {
    public:
        AttemptWriter(TransferState& state, std::size_t chunk_size, TransferObserver* observer)
            : state_(state), chunk_size_(chunk_size), observer_(observer) {
            buffer_.reserve(chunk_size_);
        }

        bool onHeaders(const HttpResponse& response) override {
            const bool resuming = state_.local_size > 0;
            const long status = response.status;

            if (resuming && status == 416) {
                const auto range = parseContentRange(response.header("content-range").value_or(""));
                if (range.complete_length && *range.complete_length == state_.local_size) {
                    already_complete_ = true;
                    return false;
                }
                // The local file is longer than the remote resource.
                if (range.complete_length && *range.complete_length < state_.local_size) {
                    stale_local_file_ = true;
                    return false;
                }
            }
            if (status >= 400) {
                throw HttpStatusError(status);
            }

            bool append = false;
            if (resuming && status == 206) {
                const auto range = parseContentRange(response.header("content-range").value_or(""));
                if (range.first_byte && *range.first_byte != state_.local_size) {
                    throw TransportError(fmt::format("unexpected Content-Range '{}' for offset {}",
                                                     response.header("content-range").value_or(""),
                                                     state_.local_size));
                }
                append = true;
            } else if (resuming) {
                logger()->info("server ignored range, restarting filename={} status={} bytes={}",
                               state_.filename, status, state_.local_size);
                state_.local_size = 0;
            }

            file_.reset(std::fopen(state_.destination.c_str(), append ? "ab" : "wb"));
            if (!file_) {
                throw std::runtime_error(fmt::format("Cannot open destination file {}: {}",
                                                     state_.destination.string(), std::strerror(errno)));
            }

            written_ = state_.local_size;
            if (const auto length = response.contentLength()) {
                total_ = *length + (append ? state_.local_size : 0);
            }
            return true;
        }

        void onBody(const char* data, std::size_t size) override {
            std::size_t offset = 0;
            if (!buffer_.empty()) {
                offset = std::min(size, chunk_size_ - buffer_.size());
                buffer_.append(data, offset);
                if (buffer_.size() == chunk_size_) {
                    writeChunk(buffer_.data(), buffer_.size());
                    buffer_.clear();
                }
            }
            while (size - offset >= chunk_size_) {
                writeChunk(data + offset, chunk_size_);
                offset += chunk_size_;
            }
            buffer_.append(data + offset, size - offset);
        }

        // Writes the trailing partial chunk and closes the file.
        void finish() {
            if (!buffer_.empty()) {
                writeChunk(buffer_.data(), buffer_.size());
                buffer_.clear();
            }
            FILE* fp = file_.release();
            if (fp && std::fclose(fp) != 0) {
                throw std::runtime_error(fmt::format("Failed to close {}: {}",
                                                     state_.destination.string(), std::strerror(errno)));
            }
        }

        [[nodiscard]] bool alreadyComplete() const noexcept { return already_complete_; }
        [[nodiscard]] bool staleLocalFile() const noexcept { return stale_local_file_; }

    private:
        void writeChunk(const char* data, std::size_t size) {
            if (std::fwrite(data, 1, size, file_.get()) != size) {
                throw std::runtime_error(fmt::format("Failed to write {}: {}",
                                                     state_.destination.string(), std::strerror(errno)));
            }
            if (std::fflush(file_.get()) != 0) {
                throw std::runtime_error(fmt::format("Failed to flush {}: {}",
                                                     state_.destination.string(), std::strerror(errno)));
            }
            written_ += size;

            if (total_ && written_ > *total_ && !overrun_logged_) {
                overrun_logged_ = true;
                logger()->warn("body longer than declared filename={} bytes={} declared={}",
                               state_.filename, written_, *total_);
            }
            report();
        }

        void report() {
            if (!observer_ || written_ < state_.reported_bytes) {
                return;
            }
            state_.reported_bytes = written_;
            try {
                observer_->onProgress(state_.filename, written_, total_);
            } catch (const std::exception& e) {
                logger()->debug("progress observer threw filename={} error={}", state_.filename, e.what());
            }
        }

        TransferState& state_;
        const std::size_t chunk_size_;
        TransferObserver* observer_;

        std::unique_ptr<FILE, FileDeleter> file_{};
        std::string buffer_;
        std::uint64_t written_{0};
        std::optional<std::uint64_t> total_;
        bool already_complete_{false};
        bool stale_local_file_{false};
        bool overrun_logged_{false};
    };

    void runAttempt(const std::string& url, TransferState& state, TransferObserver* observer) const {
        if (performOnce(url, state, observer)) {
            return;
        }
        logger()->info("local file larger than remote, restarting filename={} bytes={}",
                       state.filename, state.local_size);
        state.local_size = 0;
        if (!performOnce(url, state, observer)) {
            throw TransportError(fmt::format("cannot restart {} from zero", state.filename));
        }
    }

    // False when the partial file on disk turned out to be stale.
    bool performOnce(const std::string& url, TransferState& state, TransferObserver* observer) const {
        HttpRequest request;
        request.method = HttpMethod::Get;
        request.url = url;
        if (state.local_size > 0) {
            request.range_start = state.local_size;
        }
        request.connect_timeout = options_.request_timeout;
        request.idle_timeout = options_.request_timeout;
        request.buffer_size = options_.chunk_size;

        AttemptWriter writer(state, options_.chunk_size, observer);
        const auto response = transport_.perform(request, writer);
        if (writer.staleLocalFile()) {
            return false;
        }
        if (writer.alreadyComplete()) {
            logger()->info("already complete filename={} bytes={}", state.filename, state.local_size);
            return true;
        }
        writer.finish();
        logger()->debug("response finished filename={} status={} effective_url={}",
                        state.filename, response.status, response.effective_url);
        return true;
    }

    HttpTransport& transport_;
    TransferOptions options_;
    Sleeper sleeper_;
};

TransferEngine::TransferEngine(HttpTransport& transport, TransferOptions options, Sleeper sleeper)
    : impl_(std::make_unique<Impl>(transport, std::move(options), std::move(sleeper))) {}

TransferEngine::~TransferEngine() = default;

Outcome TransferEngine::fetch(const ResourceRequest& request,
                              const std::filesystem::path& destination_dir,
                              TransferObserver* observer) const {
    return impl_->fetch(request, destination_dir, observer);
}

std::chrono::duration<double> TransferEngine::backoffDelay(std::chrono::duration<double> base,
                                                           int attempt,
                                                           double jitter) {
    const double factor = std::pow(2.0, std::max(0, attempt - 1));
    return base * factor * jitter;
}

} // namespace parafetch
