#pragma once
#include "Outcome.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

// Single-use handoff between the dispatch loop (writer) and the caller
// waiting on a request (reader). First writer wins; once the reader has
// timed out the channel is closed and late writes are dropped.
class ReplyChannel {
public:
    enum class AwaitStatus {
        Delivered,     // outcome holds the written value
        TimedOut,      // nothing written before the deadline; channel closed
        NotAwaited,    // zero timeout: fire-and-forget, nothing observed
        Consumed       // await() already returned a value earlier
    };

    struct AwaitResult {
        AwaitStatus            status;
        std::optional<Outcome> outcome;
    };

    ReplyChannel() = default;
    ReplyChannel(const ReplyChannel&) = delete;
    ReplyChannel& operator=(const ReplyChannel&) = delete;

    // Write the outcome. Returns false if another write already won or the
    // reader has given up.
    bool deliver(Outcome outcome) {
        std::lock_guard lock(mtx_);
        if (closed_ || value_) return false;
        value_ = std::move(outcome);
        cv_.notify_all();
        return true;
    }

    AwaitResult await(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mtx_);

        if (consumed_)
            return {AwaitStatus::Consumed, std::nullopt};
        if (closed_)
            return {AwaitStatus::TimedOut, std::nullopt};

        if (timeout.count() <= 0)
            return {AwaitStatus::NotAwaited, std::nullopt};

        cv_.wait_for(lock, timeout, [this] { return value_.has_value(); });

        // A value that landed right at the deadline still wins.
        if (value_) {
            consumed_ = true;
            closed_   = true;
            AwaitResult r{AwaitStatus::Delivered, std::move(value_)};
            value_.reset();
            return r;
        }

        closed_ = true;
        return {AwaitStatus::TimedOut, std::nullopt};
    }

    // True once the reader has consumed a value or timed out.
    bool closed() const {
        std::lock_guard lock(mtx_);
        return closed_;
    }

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::optional<Outcome> value_;
    bool closed_   = false;
    bool consumed_ = false;
};
