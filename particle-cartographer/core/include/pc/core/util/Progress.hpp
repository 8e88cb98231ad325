#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

namespace pc {

// Emitted once per completed radius
struct ProgressEvent {
    int radius = 0;
    int particleCount = 0;
    double meanContacts = 0.0;
    double largestParticleRatio = 0.0;
    double percentComplete = 0.0;
};

// Called on the optimizer thread; must return quickly
using ProgressCallback = std::function<void(const ProgressEvent&)>;

/**
 * @brief Bounded hand-off between the optimizer thread and a consumer
 *
 * push() never blocks: when the queue is full the oldest event is dropped.
 * pop() blocks up to a timeout and returns nothing once the queue is closed
 * and drained.
 */
class ProgressQueue {
public:
    explicit ProgressQueue(std::size_t capacity = 256);

    void push(const ProgressEvent& event);
    std::optional<ProgressEvent> pop(std::chrono::milliseconds timeout);

    // Wakes consumers; later pushes are ignored
    void close();

    [[nodiscard]] bool closed() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t dropped() const;

    // Callback that forwards into this queue
    ProgressCallback callback();

private:
    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ProgressEvent> events_;
    std::size_t dropped_ = 0;
    bool closed_ = false;
};

// Checked by the optimizer before each radius
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true); }
    [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

}  // namespace pc
