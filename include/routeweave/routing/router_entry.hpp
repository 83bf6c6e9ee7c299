#pragma once

#include "routeweave/routing/routing.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace routeweave::routing {

// Per-backend policy for parallel composition. The timeout starts counting
// once execute_after has elapsed; a zero timeout leaves only the caller's
// deadline in force.
struct ParallelRouter {
    std::shared_ptr<Routing> router;
    std::chrono::milliseconds timeout{0};
    bool ignore_error = false;
    std::chrono::milliseconds execute_after{0};
    std::string name;
    
    std::string describe() const;
};

struct SequentialRouter {
    std::shared_ptr<Routing> router;
    std::chrono::milliseconds timeout{0};
    bool ignore_error = false;
    std::string name;
    
    std::string describe() const;
};

// Child context bounded by the router timeout, or a plain cancellable child
// when no timeout is configured.
ContextPtr router_context(const ContextPtr& parent, std::chrono::milliseconds timeout);

}
