#pragma once

#include "observer.hpp"
#include "progress.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

namespace parafetch {

// Thread-safe FIFO of transfer events for a consumer on another thread.
class EventChannel {
public:
    // Dropped silently once the channel is closed.
    void push(TransferEvent event);

    // Waits up to timeout. Empty when nothing arrived or the channel is
    // closed and drained.
    [[nodiscard]] std::optional<TransferEvent> pop(std::chrono::milliseconds timeout);
    [[nodiscard]] std::optional<TransferEvent> tryPop();

    void close();
    [[nodiscard]] bool closed() const;
    // Closed and nothing left to pop.
    [[nodiscard]] bool drained() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<TransferEvent> events_;
    bool closed_{false};
};

// Observer that forwards every callback into an EventChannel.
class ChannelObserver final : public TransferObserver {
public:
    explicit ChannelObserver(std::shared_ptr<EventChannel> channel);

    void onProgress(const std::string& filename,
                    std::uint64_t downloaded_bytes,
                    std::optional<std::uint64_t> total_bytes) override;
    void onStatus(const std::string& filename, TransferStatus status, const std::string& info) override;

private:
    std::shared_ptr<EventChannel> channel_;
};

} // namespace parafetch
