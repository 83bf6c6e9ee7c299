#pragma once

#include <string>
#include <vector>

namespace routeweave::routing {

enum class RoutingError {
    SUCCESS = 0,
    NOT_FOUND,
    NOT_SUPPORTED,
    CANCELLED,
    DEADLINE_EXCEEDED,
    BACKEND_FAILURE,
    INVALID_ARGUMENT,
    STORAGE_FAILURE,
    MULTIPLE
};

const char* to_string(RoutingError error);

struct RoutingResult {
    RoutingError error;
    std::string message;
    // Populated only for MULTIPLE, in the order the errors were observed.
    std::vector<RoutingResult> causes;
    
    RoutingResult(RoutingError err = RoutingError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == RoutingError::SUCCESS; }
    operator bool() const { return success(); }
    
    bool is_not_found() const { return error == RoutingError::NOT_FOUND; }
    bool is_cancellation() const {
        return error == RoutingError::CANCELLED || error == RoutingError::DEADLINE_EXCEEDED;
    }
    
    // Every individual failure, flattening nested aggregates.
    std::vector<RoutingResult> errors() const;
    
    std::string to_string() const;
    
    static RoutingResult not_found(std::string msg = "routing: not found") {
        return RoutingResult(RoutingError::NOT_FOUND, std::move(msg));
    }
    static RoutingResult not_supported(std::string msg = "routing: operation or key not supported") {
        return RoutingResult(RoutingError::NOT_SUPPORTED, std::move(msg));
    }
    
    // Adds err to aggregate. A success aggregate becomes err itself; a
    // second failure turns it into MULTIPLE.
    static RoutingResult append(RoutingResult aggregate, RoutingResult err);
};

}
