#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/details/log_msg.h>
#include <spdlog/sinks/base_sink.h>

namespace parafetch {

// Delivers each record as a JSON line to an HTTP endpoint from a background
// worker. Records that cannot be delivered are appended to a spool file,
// which is drained first on every later wake-up (at-least-once delivery).
// The destructor delivers or spools everything still queued.
class HttpSpoolSink final : public spdlog::sinks::base_sink<std::mutex> {
public:
    HttpSpoolSink(std::string endpoint,
                  std::filesystem::path spool_file,
                  std::chrono::milliseconds retry_interval = std::chrono::seconds(5));
    ~HttpSpoolSink() override;

    HttpSpoolSink(const HttpSpoolSink&) = delete;
    HttpSpoolSink& operator=(const HttpSpoolSink&) = delete;

    [[nodiscard]] const std::filesystem::path& spoolFile() const noexcept { return spool_file_; }

    // Waits until every record queued so far was delivered or spooled.
    // False on timeout.
    bool waitForDelivery(std::chrono::milliseconds timeout);

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override;
    // Wakes the worker without waiting for it; logging threads never block
    // on the endpoint.
    void flush_() override;

private:
    void workerLoop();
    bool deliver(const std::string& record) const;
    bool drainSpool();
    void appendToSpool(const std::vector<std::string>& records);
    [[nodiscard]] static std::string toJson(const spdlog::details::log_msg& msg);

    const std::string endpoint_;
    const std::filesystem::path spool_file_;
    const std::chrono::milliseconds retry_interval_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable done_cv_;
    std::deque<std::string> pending_;
    std::uint64_t queued_{0};
    std::uint64_t processed_{0};
    bool stopping_{false};

    std::thread worker_;
};

} // namespace parafetch
