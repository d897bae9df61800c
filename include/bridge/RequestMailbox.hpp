#pragma once
#include "UIRequest.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

// Multi-producer / single-consumer queue of UI requests.
// Producers: caller threads (never block on enqueue).
// Consumer: the dispatch loop on the UI-owning thread.
class RequestMailbox {
public:
    enum class EnqueueStatus {
        Accepted,
        NoConsumer      // dispatch loop not running, fail fast
    };

    RequestMailbox() = default;
    RequestMailbox(const RequestMailbox&) = delete;
    RequestMailbox& operator=(const RequestMailbox&) = delete;

    EnqueueStatus enqueue(UIRequest request) {
        std::lock_guard lock(mtx_);
        if (!consumerAttached_)
            return EnqueueStatus::NoConsumer;
        pending_.push_back(std::move(request));
        cv_.notify_one();
        return EnqueueStatus::Accepted;
    }

    // Pop the oldest request, waiting up to maxWait for one to arrive.
    // Returns early (empty) when wake() is called.
    std::optional<UIRequest> dequeueBlocking(std::chrono::milliseconds maxWait) {
        std::unique_lock lock(mtx_);

        if (pending_.empty() && maxWait.count() > 0) {
            cv_.wait_for(lock, maxWait,
                         [this] { return !pending_.empty() || wakeRequested_; });
        }
        wakeRequested_ = false;

        if (pending_.empty())
            return std::nullopt;

        UIRequest out = std::move(pending_.front());
        pending_.pop_front();
        return out;
    }

    // Interrupt a consumer blocked in dequeueBlocking()
    void wake() {
        std::lock_guard lock(mtx_);
        wakeRequested_ = true;
        cv_.notify_all();
    }

    void attachConsumer() {
        std::lock_guard lock(mtx_);
        consumerAttached_ = true;
    }

    // Stop accepting requests. Returns whatever was still queued so the
    // consumer can answer it.
    std::vector<UIRequest> detachConsumer() {
        std::lock_guard lock(mtx_);
        consumerAttached_ = false;
        std::vector<UIRequest> leftover;
        leftover.reserve(pending_.size());
        for (auto& r : pending_)
            leftover.push_back(std::move(r));
        pending_.clear();
        return leftover;
    }

    bool hasConsumer() const {
        std::lock_guard lock(mtx_);
        return consumerAttached_;
    }

    size_t size() const {
        std::lock_guard lock(mtx_);
        return pending_.size();
    }

private:
    std::deque<UIRequest> pending_;
    bool consumerAttached_ = false;
    bool wakeRequested_    = false;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
};
