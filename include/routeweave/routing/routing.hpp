#pragma once

#include "routeweave/routing/context.hpp"
#include "routeweave/routing/result_stream.hpp"
#include "routeweave/routing/routing_error.hpp"
#include "routeweave/routing/types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace routeweave::routing {

// Capability contract every routing backend exposes. Composite routers
// implement it as well, so compositions nest.
class Routing {
public:
    virtual ~Routing() = default;
    
    // Announce that this node can provide the content. With announce false
    // the record is only kept locally.
    virtual RoutingResult provide(const ContextPtr& ctx, const ContentId& cid, bool announce) = 0;
    
    // Stream peers providing cid. count == 0 means unbounded. The stream is
    // closed when the search ends or ctx is done.
    virtual ResultStreamPtr<AddrInfo> find_providers_async(const ContextPtr& ctx, const ContentId& cid,
                                                           int count) = 0;
    
    // NOT_FOUND when the peer is unknown.
    virtual RoutingResult find_peer(const ContextPtr& ctx, const std::string& peer_id, AddrInfo& out) = 0;
    
    virtual RoutingResult put_value(const ContextPtr& ctx, const std::string& key, const Bytes& value,
                                    const RoutingOptions& options) = 0;
    
    // NOT_FOUND when no record exists for key.
    virtual RoutingResult get_value(const ContextPtr& ctx, const std::string& key,
                                    const RoutingOptions& options, Bytes& out) = 0;
    
    // On success out is a stream of increasingly better values for key.
    virtual RoutingResult search_value(const ContextPtr& ctx, const std::string& key,
                                       const RoutingOptions& options, ResultStreamPtr<Bytes>& out) = 0;
    
    virtual RoutingResult bootstrap(const ContextPtr& ctx) = 0;
};

// Optional batch announcement capability. Callers discover it with
// dynamic_cast; the composition engine never calls it on its own.
class ProvideManyRouter {
public:
    virtual ~ProvideManyRouter() = default;
    
    virtual RoutingResult provide_many(const ContextPtr& ctx, const std::vector<ContentId>& keys) = 0;
    virtual bool ready() const = 0;
};

}
