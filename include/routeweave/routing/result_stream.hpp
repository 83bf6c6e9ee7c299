#pragma once

#include "routeweave/routing/context.hpp"
#include "routeweave/routing/routing_error.hpp"
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace routeweave::routing {

// Bounded FIFO shared between producers and one consumer.
//
// - send() blocks while the buffer is full and gives up (returning false)
//   once the stream is closed or the supplied context is done.
// - receive() blocks until an item arrives; after close() it drains what is
//   buffered and then returns std::nullopt.
// - Either side may close(). A consumer that stops reading should close the
//   stream so blocked producers return.
// - close_and_discard() also drops whatever is buffered; the consumer sees
//   the end of the stream on its next receive().
// - error() carries an optional terminal error, readable once the stream
//   has ended.
//
// Always create through create(); cancellation wake-ups hold weak
// references to the stream.
template<typename T>
class ResultStream : public std::enable_shared_from_this<ResultStream<T>> {
public:
    static constexpr std::size_t DEFAULT_CAPACITY = 16;

    static std::shared_ptr<ResultStream<T>> create(std::size_t capacity = DEFAULT_CAPACITY) {
        return std::shared_ptr<ResultStream<T>>(new ResultStream<T>(capacity));
    }

    ResultStream(const ResultStream&) = delete;
    ResultStream& operator=(const ResultStream&) = delete;

    bool send(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(item));
        cv_.notify_all();
        return true;
    }

    bool send(T item, const ContextPtr& ctx) {
        ScopedCancelCallback wake(ctx, waker());

        std::unique_lock<std::mutex> lock(mutex_);
        auto ready = [this, &ctx] { return closed_ || ctx->done() || items_.size() < capacity_; };
        wait_with_context(lock, ctx, ready);

        if (closed_ || ctx->done()) {
            return false;
        }
        items_.push_back(std::move(item));
        cv_.notify_all();
        return true;
    }

    std::optional<T> receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !items_.empty(); });
        return pop_locked();
    }

    // Returns std::nullopt as soon as ctx is done, even if items are buffered.
    std::optional<T> receive(const ContextPtr& ctx) {
        ScopedCancelCallback wake(ctx, waker());

        std::unique_lock<std::mutex> lock(mutex_);
        auto ready = [this, &ctx] { return closed_ || ctx->done() || !items_.empty(); };
        wait_with_context(lock, ctx, ready);

        if (ctx->done()) {
            return std::nullopt;
        }
        return pop_locked();
    }

    std::optional<T> try_receive() {
        std::lock_guard<std::mutex> lock(mutex_);
        return pop_locked();
    }

    // Reads until the stream ends.
    std::vector<T> drain() {
        std::vector<T> result;
        while (auto item = receive()) {
            result.push_back(std::move(*item));
        }
        return result;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    void close_and_discard() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            items_.clear();
        }
        cv_.notify_all();
    }

    // Keeps the first terminal error recorded.
    void close(RoutingResult terminal_error) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (error_.success()) {
                error_ = std::move(terminal_error);
            }
            closed_ = true;
        }
        cv_.notify_all();
    }

    void set_error(RoutingResult terminal_error) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (error_.success()) {
            error_ = std::move(terminal_error);
        }
    }

    RoutingResult error() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t buffered() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    explicit ResultStream(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    std::function<void()> waker() {
        std::weak_ptr<ResultStream<T>> weak = this->weak_from_this();
        return [weak] {
            if (auto self = weak.lock()) {
                std::lock_guard<std::mutex> lock(self->mutex_);
                self->cv_.notify_all();
            }
        };
    }

    template<typename Predicate>
    void wait_with_context(std::unique_lock<std::mutex>& lock, const ContextPtr& ctx, Predicate ready) {
        if (auto deadline = ctx->deadline()) {
            cv_.wait_until(lock, *deadline, ready);
        } else {
            cv_.wait(lock, ready);
        }
    }

    std::optional<T> pop_locked() {
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        cv_.notify_all();
        return item;
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
    RoutingResult error_;
};

template<typename T>
using ResultStreamPtr = std::shared_ptr<ResultStream<T>>;

}
