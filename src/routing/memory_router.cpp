#include "routeweave/routing/memory_router.hpp"
#include "routeweave/core/logger.hpp"
#include <algorithm>

namespace routeweave::routing {

MemoryRouter::MemoryRouter(AddrInfo self)
    : self_(std::move(self))
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!self_.empty()) {
        peers_[self_.peer_id] = self_;
    }
}

RoutingResult MemoryRouter::provide(const ContextPtr& ctx, const ContentId& cid, bool announce) {
    if (ctx->done()) {
        return ctx->err();
    }
    if (!cid.defined()) {
        return RoutingResult(RoutingError::INVALID_ARGUMENT, "cannot provide an undefined content id");
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    add_provider_locked(cid, self_);
    
    LOG_DEBUG("MemoryRouter {} providing {} (announce: {})", self_.peer_id, cid.to_hex(), announce);
    return RoutingResult();
}

ResultStreamPtr<AddrInfo> MemoryRouter::find_providers_async(const ContextPtr& ctx, const ContentId& cid,
                                                             int count) {
    std::vector<AddrInfo> found;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = providers_.find(cid);
        if (it != providers_.end()) {
            found = it->second;
        }
    }
    
    if (count > 0 && found.size() > static_cast<std::size_t>(count)) {
        found.resize(count);
    }
    
    auto out = ResultStream<AddrInfo>::create(std::max<std::size_t>(found.size(), 1));
    if (!ctx->done()) {
        for (auto& provider : found) {
            out->send(std::move(provider));
        }
    }
    out->close();
    return out;
}

RoutingResult MemoryRouter::find_peer(const ContextPtr& ctx, const std::string& peer_id, AddrInfo& out) {
    if (ctx->done()) {
        return ctx->err();
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(peer_id);
    if (it == peers_.end()) {
        return RoutingResult::not_found();
    }
    out = it->second;
    return RoutingResult();
}

RoutingResult MemoryRouter::put_value(const ContextPtr& ctx, const std::string& key, const Bytes& value,
                                      const RoutingOptions&) {
    if (ctx->done()) {
        return ctx->err();
    }
    if (key.empty()) {
        return RoutingResult(RoutingError::INVALID_ARGUMENT, "empty key");
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
    return RoutingResult();
}

RoutingResult MemoryRouter::get_value(const ContextPtr& ctx, const std::string& key,
                                      const RoutingOptions&, Bytes& out) {
    if (ctx->done()) {
        return ctx->err();
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return RoutingResult::not_found();
    }
    out = it->second;
    return RoutingResult();
}

RoutingResult MemoryRouter::search_value(const ContextPtr& ctx, const std::string& key,
                                         const RoutingOptions& options, ResultStreamPtr<Bytes>& out) {
    Bytes value;
    auto result = get_value(ctx, key, options, value);
    if (!result) {
        return result;
    }
    
    out = ResultStream<Bytes>::create(1);
    out->send(std::move(value));
    out->close();
    return RoutingResult();
}

RoutingResult MemoryRouter::bootstrap(const ContextPtr& ctx) {
    if (ctx->done()) {
        return ctx->err();
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    bootstrapped_ = true;
    return RoutingResult();
}

RoutingResult MemoryRouter::provide_many(const ContextPtr& ctx, const std::vector<ContentId>& keys) {
    if (ctx->done()) {
        return ctx->err();
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& cid : keys) {
        if (cid.defined()) {
            add_provider_locked(cid, self_);
        }
    }
    
    LOG_DEBUG("MemoryRouter {} providing {} keys in batch", self_.peer_id, keys.size());
    return RoutingResult();
}

void MemoryRouter::add_peer(const AddrInfo& peer) {
    if (peer.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    peers_[peer.peer_id] = peer;
}

void MemoryRouter::add_provider(const ContentId& cid, const AddrInfo& provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    add_provider_locked(cid, provider);
}

std::size_t MemoryRouter::provider_count(const ContentId& cid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(cid);
    return it == providers_.end() ? 0 : it->second.size();
}

std::size_t MemoryRouter::value_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.size();
}

bool MemoryRouter::bootstrapped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bootstrapped_;
}

void MemoryRouter::add_provider_locked(const ContentId& cid, const AddrInfo& provider) {
    auto& providers = providers_[cid];
    auto existing = std::find_if(providers.begin(), providers.end(),
        [&provider](const AddrInfo& p) { return p.peer_id == provider.peer_id; });
    
    if (existing != providers.end()) {
        *existing = provider;
    } else {
        providers.push_back(provider);
    }
    
    if (!provider.empty()) {
        peers_[provider.peer_id] = provider;
    }
}

}
