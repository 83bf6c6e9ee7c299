#pragma once

#include "routeweave/routing/router_entry.hpp"
#include "routeweave/routing/routing.hpp"
#include <vector>

namespace routeweave::routing {

// Executes every method on all configured routers in parallel.
//
// Write-style methods (provide, put_value, bootstrap) wait for every router
// and fail with the aggregate of all non-ignored errors; some routers may
// already have applied the write when an error is returned. Lookups
// (find_peer, get_value) return the first usable answer and cancel the
// remaining routers. Streaming methods merge all router streams in no
// particular order.
//
// execute_after delays a router relative to the start of the call, which
// lets cheap routers answer before expensive ones are tried. The router
// timeout starts counting once execute_after has elapsed.
class ComposableParallel : public Routing, public ProvideManyRouter {
public:
    explicit ComposableParallel(std::vector<ParallelRouter> routers);
    ~ComposableParallel() override = default;
    
    RoutingResult provide(const ContextPtr& ctx, const ContentId& cid, bool announce) override;
    
    // With count > 0 at most about count providers are delivered across all
    // routers. Use execute_after to prefer the providers of some routers.
    ResultStreamPtr<AddrInfo> find_providers_async(const ContextPtr& ctx, const ContentId& cid,
                                                   int count) override;
    
    RoutingResult find_peer(const ContextPtr& ctx, const std::string& peer_id, AddrInfo& out) override;
    RoutingResult put_value(const ContextPtr& ctx, const std::string& key, const Bytes& value,
                            const RoutingOptions& options) override;
    RoutingResult get_value(const ContextPtr& ctx, const std::string& key,
                            const RoutingOptions& options, Bytes& out) override;
    
    // Always hands back a stream unless ctx is already done. The first hard
    // router failure becomes the stream's terminal error; the stream ends
    // with NOT_FOUND when no router delivered anything.
    RoutingResult search_value(const ContextPtr& ctx, const std::string& key,
                               const RoutingOptions& options, ResultStreamPtr<Bytes>& out) override;
    
    RoutingResult bootstrap(const ContextPtr& ctx) override;
    
    // Forwards to every router supporting batch announcements, with the same
    // require-all semantics as provide(). NOT_SUPPORTED when none does.
    RoutingResult provide_many(const ContextPtr& ctx, const std::vector<ContentId>& keys) override;
    bool ready() const override;
    
    const std::vector<ParallelRouter>& routers() const { return routers_; }

private:
    std::vector<ParallelRouter> batch_routers() const;
    
    const std::vector<ParallelRouter> routers_;
};

}
