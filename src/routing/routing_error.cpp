#include "routeweave/routing/routing_error.hpp"
#include <sstream>

namespace routeweave::routing {

const char* to_string(RoutingError error) {
    switch (error) {
        case RoutingError::SUCCESS: return "success";
        case RoutingError::NOT_FOUND: return "not found";
        case RoutingError::NOT_SUPPORTED: return "not supported";
        case RoutingError::CANCELLED: return "cancelled";
        case RoutingError::DEADLINE_EXCEEDED: return "deadline exceeded";
        case RoutingError::BACKEND_FAILURE: return "backend failure";
        case RoutingError::INVALID_ARGUMENT: return "invalid argument";
        case RoutingError::STORAGE_FAILURE: return "storage failure";
        case RoutingError::MULTIPLE: return "multiple errors";
    }
    return "unknown";
}

std::vector<RoutingResult> RoutingResult::errors() const {
    if (success()) {
        return {};
    }
    if (error != RoutingError::MULTIPLE) {
        return {*this};
    }
    
    std::vector<RoutingResult> flat;
    for (const auto& cause : causes) {
        auto nested = cause.errors();
        flat.insert(flat.end(), nested.begin(), nested.end());
    }
    return flat;
}

std::string RoutingResult::to_string() const {
    if (error != RoutingError::MULTIPLE) {
        if (message.empty()) {
            return routing::to_string(error);
        }
        return message;
    }
    
    std::ostringstream oss;
    oss << causes.size() << " errors occurred:";
    for (const auto& cause : causes) {
        oss << "\n\t* " << cause.to_string();
    }
    return oss.str();
}

RoutingResult RoutingResult::append(RoutingResult aggregate, RoutingResult err) {
    if (err.success()) {
        return aggregate;
    }
    if (aggregate.success()) {
        return err;
    }
    
    if (aggregate.error != RoutingError::MULTIPLE) {
        RoutingResult first = std::move(aggregate);
        aggregate = RoutingResult(RoutingError::MULTIPLE);
        aggregate.causes.push_back(std::move(first));
    }
    
    aggregate.causes.push_back(std::move(err));
    aggregate.message = aggregate.to_string();
    return aggregate;
}

}
