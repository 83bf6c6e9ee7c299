#include "routeweave/routing/router_config.hpp"
#include "routeweave/routing/composable_parallel.hpp"
#include "routeweave/routing/composable_sequential.hpp"
#include "routeweave/routing/memory_router.hpp"
#include "routeweave/routing/null_router.hpp"
#include "routeweave/storage/sqlite_router.hpp"
#include "routeweave/core/logger.hpp"
#include "routeweave/core/utils.hpp"
#include <stdexcept>

namespace routeweave::routing {

using core::utils::FileUtils;
using core::utils::StringUtils;

std::shared_ptr<Routing> build_router(const core::Config& config) {
    RouterBuilder builder(config);
    return builder.build();
}

AddrInfo node_identity(const core::Config& config) {
    AddrInfo self;
    self.peer_id = config.get_string("node.peer_id", "local");
    self.addresses = config.get_list("node.addresses");
    return self;
}

RouterBuilder::RouterBuilder(const core::Config& config)
    : config_(config), self_(node_identity(config)) {
}

std::shared_ptr<Routing> RouterBuilder::build() {
    auto composer = StringUtils::to_lower(config_.get_string("routing.composer", "parallel"));
    auto names = config_.get_list("routing.routers");
    if (names.empty()) {
        throw std::runtime_error("routing.routers lists no routers");
    }

    in_progress_.clear();
    auto router = build_composite(composer, names);
    LOG_INFO("Built {} composition over {} routers", composer, names.size());
    return router;
}

std::shared_ptr<Routing> RouterBuilder::build_composite(const std::string& composer,
                                                        const std::vector<std::string>& names) {
    if (composer == "parallel") {
        std::vector<ParallelRouter> entries;
        for (const auto& name : names) {
            ParallelRouter entry;
            entry.router = build_named(name);
            entry.timeout = duration_key("router." + name + ".timeout");
            entry.execute_after = duration_key("router." + name + ".execute_after");
            entry.ignore_error = config_.get_bool("router." + name + ".ignore_error", false);
            entry.name = name;
            LOG_DEBUG("Parallel entry {}", entry.describe());
            entries.push_back(std::move(entry));
        }
        return std::make_shared<ComposableParallel>(std::move(entries));
    }

    if (composer == "sequential") {
        std::vector<SequentialRouter> entries;
        for (const auto& name : names) {
            if (config_.contains("router." + name + ".execute_after")) {
                LOG_WARN("router.{}.execute_after has no effect in a sequential composition", name);
            }
            SequentialRouter entry;
            entry.router = build_named(name);
            entry.timeout = duration_key("router." + name + ".timeout");
            entry.ignore_error = config_.get_bool("router." + name + ".ignore_error", false);
            entry.name = name;
            LOG_DEBUG("Sequential entry {}", entry.describe());
            entries.push_back(std::move(entry));
        }
        return std::make_shared<ComposableSequential>(std::move(entries));
    }

    throw std::runtime_error("Unknown composer: " + composer);
}

std::shared_ptr<Routing> RouterBuilder::build_named(const std::string& name) {
    auto type_key = "router." + name + ".type";
    if (!config_.contains(type_key)) {
        throw std::runtime_error("Router " + name + " is not configured (missing " + type_key + ")");
    }
    if (!in_progress_.insert(name).second) {
        throw std::runtime_error("Router " + name + " references itself");
    }

    auto type = StringUtils::to_lower(config_.get_string(type_key));
    std::shared_ptr<Routing> router;
    if (type == "parallel" || type == "sequential") {
        auto children = config_.get_list("router." + name + ".routers");
        if (children.empty()) {
            throw std::runtime_error("Composite router " + name + " lists no routers");
        }
        router = build_composite(type, children);
    } else {
        router = build_backend(name, type);
    }

    in_progress_.erase(name);
    return router;
}

std::shared_ptr<Routing> RouterBuilder::build_backend(const std::string& name, const std::string& type) {
    if (type == "memory") {
        return std::make_shared<MemoryRouter>(self_);
    }

    if (type == "null") {
        return std::make_shared<NullRouter>();
    }

    if (type == "sqlite") {
        auto path = config_.get_string("router." + name + ".path");
        if (path.empty()) {
            throw std::runtime_error("Router " + name + " needs router." + name + ".path");
        }
        auto router = std::make_shared<storage::SqliteRouter>(FileUtils::expand_home(path), self_);
        if (!router->initialize()) {
            throw std::runtime_error("Router " + name + " could not open " + path);
        }
        return router;
    }

    throw std::runtime_error("Router " + name + " has unknown type: " + type);
}

std::chrono::milliseconds RouterBuilder::duration_key(const std::string& key) const {
    try {
        return config_.get_duration(key);
    } catch (const std::logic_error& e) {
        throw std::runtime_error("Invalid duration for " + key + ": " + e.what());
    }
}

}
