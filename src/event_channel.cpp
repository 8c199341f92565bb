#include "parafetch/event_channel.hpp"

#include <utility>

namespace parafetch {

void EventChannel::push(TransferEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
}

std::optional<TransferEvent> EventChannel::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return closed_ || !events_.empty(); })) {
        return std::nullopt;
    }
    if (events_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<TransferEvent> EventChannel::tryPop() {
    return pop(std::chrono::milliseconds::zero());
}

void EventChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool EventChannel::drained() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ && events_.empty();
}

ChannelObserver::ChannelObserver(std::shared_ptr<EventChannel> channel) : channel_(std::move(channel)) {}

void ChannelObserver::onProgress(const std::string& filename,
                                 std::uint64_t downloaded_bytes,
                                 std::optional<std::uint64_t> total_bytes) {
    TransferEvent event;
    event.kind = TransferEvent::Kind::Progress;
    event.progress = Progress{filename, downloaded_bytes, total_bytes};
    channel_->push(std::move(event));
}

void ChannelObserver::onStatus(const std::string& filename, TransferStatus status, const std::string& info) {
    TransferEvent event;
    event.kind = TransferEvent::Kind::Status;
    event.progress.filename = filename;
    event.status = status;
    event.info = info;
    channel_->push(std::move(event));
}

} // namespace parafetch
