#pragma once

#include "routeweave/routing/router_entry.hpp"
#include "routeweave/routing/routing.hpp"
#include <vector>

namespace routeweave::routing {

// Tries routers strictly in the configured order.
//
// Writes stop at the first non-ignored failure. Lookups continue past
// NOT_FOUND, ignored errors and empty answers and stop at the first value
// or hard error. Streams drain each router in turn on a background thread.
class ComposableSequential : public Routing {
public:
    explicit ComposableSequential(std::vector<SequentialRouter> routers);
    ~ComposableSequential() override = default;
    
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
    
    const std::vector<SequentialRouter>& routers() const { return routers_; }

private:
    template<typename Operation>
    RoutingResult execute_sequential(const ContextPtr& ctx, Operation op);
    
    template<typename T, typename Operation, typename IsEmpty>
    RoutingResult get_value_sequential(const ContextPtr& ctx, Operation op, IsEmpty is_empty, T& out);
    
    const std::vector<SequentialRouter> routers_;
};

}
