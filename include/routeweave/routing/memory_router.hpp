#pragma once

#include "routeweave/routing/routing.hpp"
#include <mutex>
#include <unordered_map>
#include <vector>

namespace routeweave::routing {

// Thread-safe in-process routing table. Useful as a local cache in front of
// slower routers and as a test backend.
class MemoryRouter : public Routing, public ProvideManyRouter {
public:
    explicit MemoryRouter(AddrInfo self);
    ~MemoryRouter() override = default;
    
    RoutingResult provide(const ContextPtr& ctx, const ContentId& cid, bool announce) override;
    ResultStreamPtr<AddrInfo> find_providers_async(const ContextPtr& ctx, const ContentId& cid,
                                                   int count) override;
    RoutingResult find_peer(const ContextPtr& ctx, const std::string& peer_id, AddrInfo& out) override;
    RoutingResult put_value(const ContextPtr& ctx, const std::string& key, const Bytes& value,
                            const RoutingOptions& options) override;
    RoutingResult get_value(const ContextPtr& ctx, const std::string& key,
                            const RoutingOptions& options, Bytes& out) override;
    RoutingResult search_value(const ContextPtr& ctx, const std::string& key,
                               const RoutingOptions& options, ResultStreamPtr<Bytes>& out) override;
    RoutingResult bootstrap(const ContextPtr& ctx) override;
    
    RoutingResult provide_many(const ContextPtr& ctx, const std::vector<ContentId>& keys) override;
    bool ready() const override { return true; }
    
    void add_peer(const AddrInfo& peer);
    void add_provider(const ContentId& cid, const AddrInfo& provider);
    
    std::size_t provider_count(const ContentId& cid) const;
    std::size_t value_count() const;
    bool bootstrapped() const;

private:
    void add_provider_locked(const ContentId& cid, const AddrInfo& provider);
    
    const AddrInfo self_;
    mutable std::mutex mutex_;
    std::unordered_map<ContentId, std::vector<AddrInfo>> providers_;
    std::unordered_map<std::string, AddrInfo> peers_;
    std::unordered_map<std::string, Bytes> values_;
    bool bootstrapped_ = false;
};

}
