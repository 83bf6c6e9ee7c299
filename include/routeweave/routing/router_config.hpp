#pragma once

#include "routeweave/core/config.hpp"
#include "routeweave/routing/routing.hpp"
#include <memory>
#include <set>
#include <string>

namespace routeweave::routing {

// Builds the routing composition described by the routing.* and router.*
// configuration keys. Throws std::runtime_error when the configuration is
// invalid.
std::shared_ptr<Routing> build_router(const core::Config& config);

// Node identity used by the local backends (node.peer_id, node.addresses).
AddrInfo node_identity(const core::Config& config);

class RouterBuilder {
public:
    explicit RouterBuilder(const core::Config& config);
    
    std::shared_ptr<Routing> build();

private:
    std::shared_ptr<Routing> build_composite(const std::string& composer, const std::vector<std::string>& names);
    std::shared_ptr<Routing> build_named(const std::string& name);
    std::shared_ptr<Routing> build_backend(const std::string& name, const std::string& type);
    std::chrono::milliseconds duration_key(const std::string& key) const;
    
    const core::Config& config_;
    AddrInfo self_;
    std::set<std::string> in_progress_;
};

}
