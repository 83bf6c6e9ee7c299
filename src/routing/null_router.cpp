#include "routeweave/routing/null_router.hpp"

namespace routeweave::routing {

RoutingResult NullRouter::provide(const ContextPtr&, const ContentId&, bool) {
    return RoutingResult::not_supported();
}

ResultStreamPtr<AddrInfo> NullRouter::find_providers_async(const ContextPtr&, const ContentId&, int) {
    auto out = ResultStream<AddrInfo>::create(1);
    out->close();
    return out;
}

RoutingResult NullRouter::find_peer(const ContextPtr&, const std::string&, AddrInfo&) {
    return RoutingResult::not_found();
}

RoutingResult NullRouter::put_value(const ContextPtr&, const std::string&, const Bytes&, const RoutingOptions&) {
    return RoutingResult::not_supported();
}

RoutingResult NullRouter::get_value(const ContextPtr&, const std::string&, const RoutingOptions&, Bytes&) {
    return RoutingResult::not_found();
}

RoutingResult NullRouter::search_value(const ContextPtr&, const std::string&, const RoutingOptions&,
                                       ResultStreamPtr<Bytes>&) {
    return RoutingResult::not_found();
}

RoutingResult NullRouter::bootstrap(const ContextPtr&) {
    return RoutingResult();
}

}
