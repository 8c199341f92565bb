#include "parafetch/log_spool_sink.hpp"

#include "parafetch/detail/curl_utils.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <memory>
#include <system_error>
#include <utility>

#include <curl/curl.h>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <json/json.h>

namespace parafetch {

namespace {

constexpr long kDeliveryTimeoutMs = 5000;
constexpr long kConnectTimeoutMs = 2000;

size_t discardBody(char*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

} // namespace

HttpSpoolSink::HttpSpoolSink(std::string endpoint,
                             std::filesystem::path spool_file,
                             std::chrono::milliseconds retry_interval)
    : endpoint_(std::move(endpoint)),
      spool_file_(std::move(spool_file)),
      retry_interval_(retry_interval) {
    detail::ensureCurlInitialized();
    worker_ = std::thread([this] { workerLoop(); });
}

HttpSpoolSink::~HttpSpoolSink() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void HttpSpoolSink::sink_it_(const spdlog::details::log_msg& msg) {
    auto record = toJson(msg);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        pending_.push_back(std::move(record));
        ++queued_;
    }
    queue_cv_.notify_one();
}

void HttpSpoolSink::flush_() {
    queue_cv_.notify_one();
}

bool HttpSpoolSink::waitForDelivery(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    const auto target = queued_;
    return done_cv_.wait_for(lock, timeout, [&] { return processed_ >= target; });
}

void HttpSpoolSink::workerLoop() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    while (true) {
        queue_cv_.wait_for(lock, retry_interval_, [this] { return stopping_ || !pending_.empty(); });

        std::vector<std::string> batch(pending_.begin(), pending_.end());
        pending_.clear();
        const bool stop = stopping_;
        lock.unlock();

        // Older records go first; once one fails, everything after it is
        // spooled to keep the order.
        bool delivering = drainSpool();
        std::vector<std::string> undelivered;
        for (auto& record : batch) {
            if (delivering && deliver(record)) {
                continue;
            }
            delivering = false;
            undelivered.push_back(std::move(record));
        }
        if (!undelivered.empty()) {
            appendToSpool(undelivered);
        }

        lock.lock();
        processed_ += batch.size();
        done_cv_.notify_all();
        if (stop && pending_.empty()) {
            break;
        }
    }
}

bool HttpSpoolSink::deliver(const std::string& record) const {
    using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
    using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        return false;
    }
    HeaderList headers{curl_slist_append(nullptr, "Content-Type: application/json"), &curl_slist_free_all};

    curl_easy_setopt(curl.get(), CURLOPT_URL, endpoint_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, record.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(record.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &discardBody);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, kDeliveryTimeoutMs);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, kConnectTimeoutMs);

    return curl_easy_perform(curl.get()) == CURLE_OK;
}

bool HttpSpoolSink::drainSpool() {
    std::error_code ec;
    if (!std::filesystem::exists(spool_file_, ec)) {
        return true;
    }

    std::vector<std::string> records;
    {
        std::ifstream in(spool_file_);
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty()) {
                records.push_back(std::move(line));
            }
        }
    }

    std::size_t delivered = 0;
    while (delivered < records.size() && deliver(records[delivered])) {
        ++delivered;
    }
    if (delivered == 0 && !records.empty()) {
        return false;
    }

    if (delivered == records.size()) {
        std::filesystem::remove(spool_file_, ec);
        return true;
    }

    // Rewrite the remainder through a temporary file so a crash never loses it.
    auto tmp = spool_file_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        for (std::size_t i = delivered; i < records.size(); ++i) {
            out << records[i] << '\n';
        }
    }
    std::filesystem::rename(tmp, spool_file_, ec);
    if (ec) {
        fmt::print(stderr, "parafetch: cannot rewrite log spool {}: {}\n", spool_file_.string(), ec.message());
    }
    return false;
}

void HttpSpoolSink::appendToSpool(const std::vector<std::string>& records) {
    std::ofstream out(spool_file_, std::ios::app);
    if (!out) {
        fmt::print(stderr, "parafetch: cannot open log spool {}, {} records lost\n",
                   spool_file_.string(), records.size());
        return;
    }
    for (const auto& record : records) {
        out << record << '\n';
    }
}

std::string HttpSpoolSink::toJson(const spdlog::details::log_msg& msg) {
    const auto seconds = std::chrono::system_clock::to_time_t(msg.time);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            msg.time.time_since_epoch()).count() % 1000;
    const auto level = spdlog::level::to_string_view(msg.level);

    Json::Value record;
    record["timestamp"] = fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z", fmt::gmtime(seconds), millis);
    record["level"] = std::string(level.data(), level.size());
    record["logger"] = std::string(msg.logger_name.data(), msg.logger_name.size());
    record["message"] = std::string(msg.payload.data(), msg.payload.size());
    record["thread"] = static_cast<Json::UInt64>(msg.thread_id);

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, record);
}

} // namespace parafetch
