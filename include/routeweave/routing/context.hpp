#pragma once

#include "routeweave/routing/routing_error.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace routeweave::routing {

class Context;
using ContextPtr = std::shared_ptr<Context>;

// Cancellation scope handed to every routing call. Cancelling a context
// cancels every context derived from it. Deadlines are inherited: a derived
// context never outlives its parent's deadline.
class Context {
public:
    using Clock = std::chrono::steady_clock;
    using CallbackId = std::uint64_t;
    
    ~Context();
    
    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;
    
    static ContextPtr background();
    static ContextPtr with_cancel(const ContextPtr& parent);
    static ContextPtr with_timeout(const ContextPtr& parent, Clock::duration timeout);
    static ContextPtr with_deadline(const ContextPtr& parent, Clock::time_point deadline);
    
    void cancel();
    
    bool done() const;
    // SUCCESS while running, CANCELLED or DEADLINE_EXCEEDED afterwards.
    RoutingResult err() const;
    std::optional<Clock::time_point> deadline() const { return deadline_; }
    
    // Returns true when the context finished before the duration elapsed.
    bool wait_for(Clock::duration duration) const;
    void wait() const;
    
    // Invoked once on explicit cancellation (own or inherited), not on
    // deadline expiry. Runs immediately when the context is already cancelled.
    CallbackId on_cancel(std::function<void()> callback);
    void remove_callback(CallbackId id);

private:
    Context(ContextPtr parent, std::optional<Clock::time_point> deadline);
    
    static ContextPtr derive(const ContextPtr& parent, std::optional<Clock::time_point> deadline);
    void finish(RoutingError reason);
    
    ContextPtr parent_;
    const std::optional<Clock::time_point> deadline_;
    std::atomic<RoutingError> reason_{RoutingError::SUCCESS};
    
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::vector<std::weak_ptr<Context>> children_;
    std::unordered_map<CallbackId, std::function<void()>> callbacks_;
    CallbackId next_callback_id_ = 1;
};

// Keeps a cancellation callback registered for the lifetime of the guard.
class ScopedCancelCallback {
public:
    ScopedCancelCallback(const ContextPtr& ctx, std::function<void()> callback)
        : ctx_(ctx), id_(ctx->on_cancel(std::move(callback))) {}
    ~ScopedCancelCallback() { ctx_->remove_callback(id_); }
    
    ScopedCancelCallback(const ScopedCancelCallback&) = delete;
    ScopedCancelCallback& operator=(const ScopedCancelCallback&) = delete;

private:
    ContextPtr ctx_;
    Context::CallbackId id_;
};

}
