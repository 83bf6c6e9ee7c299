#pragma once

#include "routeweave/routing/routing.hpp"

namespace routeweave::routing {

// Routes nothing: writes are unsupported, lookups find nothing.
class NullRouter : public Routing {
public:
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
};

}
