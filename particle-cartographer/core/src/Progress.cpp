#include "pc/core/util/Progress.hpp"

#include "pc/core/util/Errors.hpp"

namespace pc {

ProgressQueue::ProgressQueue(std::size_t capacity) : capacity_(capacity)
{
    if (capacity_ == 0) {
        throw InputError("progress queue capacity must be > 0");
    }
}

void ProgressQueue::push(const ProgressEvent& event)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        if (events_.size() >= capacity_) {
            events_.pop_front();
            ++dropped_;
        }
        events_.push_back(event);
    }
    cv_.notify_one();
}

std::optional<ProgressEvent> ProgressQueue::pop(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; });
    if (events_.empty()) {
        return std::nullopt;
    }
    ProgressEvent event = events_.front();
    events_.pop_front();
    return event;
}

void ProgressQueue::close()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ProgressQueue::closed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t ProgressQueue::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

std::size_t ProgressQueue::dropped() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

ProgressCallback ProgressQueue::callback()
{
    return [this](const ProgressEvent& event) { push(event); };
}

}  // namespace pc
