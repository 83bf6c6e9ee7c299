#include "routeweave/routing/router_entry.hpp"
#include "routeweave/core/utils.hpp"
#include <sstream>

namespace routeweave::routing {

using routeweave::core::utils::StringUtils;

std::string ParallelRouter::describe() const {
    std::ostringstream oss;
    oss << (name.empty() ? "router" : name)
        << " (timeout=" << StringUtils::format_duration(timeout)
        << ", execute_after=" << StringUtils::format_duration(execute_after)
        << ", ignore_error=" << (ignore_error ? "true" : "false") << ")";
    return oss.str();
}

std::string SequentialRouter::describe() const {
    std::ostringstream oss;
    oss << (name.empty() ? "router" : name)
        << " (timeout=" << StringUtils::format_duration(timeout)
        << ", ignore_error=" << (ignore_error ? "true" : "false") << ")";
    return oss.str();
}

ContextPtr router_context(const ContextPtr& parent, std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return Context::with_cancel(parent);
    }
    return Context::with_timeout(parent, timeout);
}

}
