#pragma once

#include "events.h"

#include <condition_variable>
#include <mutex>
#include <queue>
#include <utility>

namespace pipeline {

// Producer/consumer channel between the pipeline thread and the transport.
// Unbounded: the producer never waits on a slow consumer.
class event_channel : public event_sink {
public:
    bool emit(pipeline_event event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        queue_.push(std::move(event));
        not_empty_.notify_one();
        return true;
    }

    // Blocks until an event is available. Returns false once closed and drained.
    bool pop(pipeline_event& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this]() { return closed_ || !queue_.empty(); });
        if (queue_.empty()) {
            return false;
        }
        out = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    // End-of-stream. Events already queued are still delivered.
    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        not_empty_.notify_all();
    }

    // Consumer went away: drop pending events and reject further ones
    void abandon() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        std::queue<pipeline_event>().swap(queue_);
        not_empty_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::queue<pipeline_event> queue_;
    bool closed_ = false;
};

} // namespace pipeline
