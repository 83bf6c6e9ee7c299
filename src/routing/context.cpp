#include "routeweave/routing/context.hpp"
#include <algorithm>

namespace routeweave::routing {

Context::Context(ContextPtr parent, std::optional<Clock::time_point> deadline)
    : parent_(std::move(parent))
    , deadline_(deadline)
{
}

Context::~Context() = default;

ContextPtr Context::background() {
    return ContextPtr(new Context(nullptr, std::nullopt));
}

ContextPtr Context::with_cancel(const ContextPtr& parent) {
    return derive(parent, std::nullopt);
}

ContextPtr Context::with_timeout(const ContextPtr& parent, Clock::duration timeout) {
    return derive(parent, Clock::now() + timeout);
}

ContextPtr Context::with_deadline(const ContextPtr& parent, Clock::time_point deadline) {
    return derive(parent, deadline);
}

ContextPtr Context::derive(const ContextPtr& parent, std::optional<Clock::time_point> deadline) {
    if (!parent) {
        return ContextPtr(new Context(nullptr, deadline));
    }
    
    auto effective = parent->deadline_;
    if (deadline && (!effective || *deadline < *effective)) {
        effective = deadline;
    }
    
    auto child = ContextPtr(new Context(parent, effective));
    
    RoutingError inherited = RoutingError::SUCCESS;
    {
        std::lock_guard<std::mutex> lock(parent->mutex_);
        inherited = parent->reason_.load();
        if (inherited == RoutingError::SUCCESS) {
            auto& children = parent->children_;
            children.erase(
                std::remove_if(children.begin(), children.end(),
                    [](const std::weak_ptr<Context>& c) { return c.expired(); }),
                children.end());
            children.push_back(child);
        }
    }
    
    if (inherited != RoutingError::SUCCESS) {
        child->finish(inherited);
    }
    
    return child;
}

void Context::cancel() {
    finish(RoutingError::CANCELLED);
}

void Context::finish(RoutingError reason) {
    std::vector<std::weak_ptr<Context>> children;
    std::vector<std::function<void()>> callbacks;
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto expected = RoutingError::SUCCESS;
        if (!reason_.compare_exchange_strong(expected, reason)) {
            return;
        }
        
        children.swap(children_);
        callbacks.reserve(callbacks_.size());
        for (auto& [id, callback] : callbacks_) {
            callbacks.push_back(std::move(callback));
        }
        callbacks_.clear();
    }
    cv_.notify_all();
    
    for (auto& callback : callbacks) {
        callback();
    }
    
    for (auto& weak_child : children) {
        if (auto child = weak_child.lock()) {
            child->finish(reason);
        }
    }
}

bool Context::done() const {
    if (reason_.load() != RoutingError::SUCCESS) {
        return true;
    }
    return deadline_ && Clock::now() >= *deadline_;
}

RoutingResult Context::err() const {
    auto reason = reason_.load();
    if (reason == RoutingError::CANCELLED) {
        return RoutingResult(RoutingError::CANCELLED, "context canceled");
    }
    if (reason == RoutingError::DEADLINE_EXCEEDED ||
        (deadline_ && Clock::now() >= *deadline_)) {
        return RoutingResult(RoutingError::DEADLINE_EXCEEDED, "context deadline exceeded");
    }
    return RoutingResult();
}

bool Context::wait_for(Clock::duration duration) const {
    auto until = Clock::now() + duration;
    if (deadline_ && *deadline_ < until) {
        until = *deadline_;
    }
    
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, until, [this] { return reason_.load() != RoutingError::SUCCESS; });
    return done();
}

void Context::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    if (deadline_) {
        cv_.wait_until(lock, *deadline_, [this] { return reason_.load() != RoutingError::SUCCESS; });
    } else {
        cv_.wait(lock, [this] { return reason_.load() != RoutingError::SUCCESS; });
    }
}

Context::CallbackId Context::on_cancel(std::function<void()> callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reason_.load() == RoutingError::SUCCESS) {
            auto id = next_callback_id_++;
            callbacks_.emplace(id, std::move(callback));
            return id;
        }
    }
    
    callback();
    return 0;
}

void Context::remove_callback(CallbackId id) {
    if (id == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.erase(id);
}

}
