#include "routeweave/core/command_handler.hpp"
#include "routeweave/core/logger.hpp"
#include "routeweave/core/utils.hpp"
#include "routeweave/crypto/content_hash.hpp"
#include "routeweave/routing/composable_parallel.hpp"
#include "routeweave/routing/composable_sequential.hpp"
#include "routeweave/routing/memory_router.hpp"
#include "routeweave/routing/null_router.hpp"
#include "routeweave/storage/sqlite_router.hpp"
#include <stdexcept>

namespace routeweave::core {

using routing::AddrInfo;
using routing::Bytes;
using routing::ContentId;
using routing::Context;
using routing::RoutingOptions;
using routing::RoutingResult;
using utils::StringUtils;

namespace {
    std::string to_text(const Bytes& value) {
        return std::string(value.begin(), value.end());
    }

    std::string format_peer(const AddrInfo& info) {
        if (info.addresses.empty()) {
            return info.peer_id;
        }
        return info.peer_id + " " + StringUtils::join(info.addresses, ",");
    }

    CommandResult routing_failure(const std::string& what, const RoutingResult& result) {
        return CommandResult::error(what + ": " + result.to_string(), result.is_not_found() ? 2 : 1);
    }
}

routing::ContextPtr RoutingSession::request_context() const {
    if (request_timeout.count() > 0) {
        return Context::with_timeout(Context::background(), request_timeout);
    }
    return Context::with_cancel(Context::background());
}

// ProvideCommandHandler Implementation
CommandResult ProvideCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    ContentId cid;
    try {
        cid = ContentId::from_hex(args[1]);
    } catch (const std::invalid_argument&) {
        cid = ContentId();
    }
    if (!crypto::is_blake2b_content_id(cid)) {
        cid = crypto::content_id_for(args[1]);
    }

    LOG_INFO("Providing {}", cid.to_hex());
    auto ctx = session_->request_context();
    auto result = router().provide(ctx, cid, true);
    ctx->cancel();

    if (!result) {
        return routing_failure("Provide failed", result);
    }

    out() << cid.to_hex() << "\n";
    return CommandResult::ok("Provided " + cid.to_hex());
}

// ProvidersCommandHandler Implementation
CommandResult ProvidersCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    ContentId cid;
    try {
        cid = ContentId::from_hex(args[1]);
    } catch (const std::invalid_argument& e) {
        return CommandResult::error("Invalid content id: " + std::string(e.what()));
    }

    auto ctx = session_->request_context();
    auto stream = router().find_providers_async(ctx, cid, session_->count);

    std::size_t found = 0;
    while (auto provider = stream->receive(ctx)) {
        out() << format_peer(*provider) << "\n";
        found++;
    }
    stream->close();

    auto interrupted = ctx->err();
    ctx->cancel();

    LOG_DEBUG("Found {} providers for {}", found, cid.to_hex());
    if (found == 0) {
        if (!interrupted) {
            return routing_failure("No providers found", interrupted);
        }
        return routing_failure("No providers found", RoutingResult::not_found());
    }
    return CommandResult::ok("Found " + std::to_string(found) + " providers");
}

// PeerCommandHandler Implementation
CommandResult PeerCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto ctx = session_->request_context();
    AddrInfo info;
    auto result = router().find_peer(ctx, args[1], info);
    ctx->cancel();

    if (!result) {
        return routing_failure("Peer lookup failed", result);
    }

    out() << format_peer(info) << "\n";
    return CommandResult::ok();
}

// PutCommandHandler Implementation
CommandResult PutCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::error("Usage: " + get_usage());
    }

    Bytes value(args[2].begin(), args[2].end());
    auto ctx = session_->request_context();
    auto result = router().put_value(ctx, args[1], value, RoutingOptions{});
    ctx->cancel();

    if (!result) {
        return routing_failure("Put failed", result);
    }

    LOG_INFO("Stored {} bytes under {}", value.size(), args[1]);
    return CommandResult::ok("Stored " + args[1]);
}

// GetCommandHandler Implementation
CommandResult GetCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto ctx = session_->request_context();
    Bytes value;
    auto result = router().get_value(ctx, args[1], RoutingOptions{}, value);
    ctx->cancel();

    if (!result) {
        return routing_failure("Get failed", result);
    }

    out() << to_text(value) << "\n";
    return CommandResult::ok();
}

// SearchCommandHandler Implementation
CommandResult SearchCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto ctx = session_->request_context();
    routing::ResultStreamPtr<Bytes> stream;
    auto result = router().search_value(ctx, args[1], RoutingOptions{}, stream);
    if (!result) {
        ctx->cancel();
        return routing_failure("Search failed", result);
    }

    std::size_t found = 0;
    while (auto value = stream->receive(ctx)) {
        out() << to_text(*value) << "\n";
        found++;
    }
    stream->close();

    auto interrupted = ctx->err();
    ctx->cancel();

    auto terminal = stream->error();
    if (!terminal && !terminal.is_not_found()) {
        LOG_WARN("Search for {} ended with: {}", args[1], terminal.to_string());
    }
    if (found == 0) {
        if (!interrupted) {
            return routing_failure("Search failed", interrupted);
        }
        return routing_failure("Search failed", terminal ? RoutingResult::not_found() : terminal);
    }
    return CommandResult::ok("Found " + std::to_string(found) + " values");
}

// BootstrapCommandHandler Implementation
CommandResult BootstrapCommandHandler::execute(const std::vector<std::string>&) {
    auto ctx = session_->request_context();
    auto result = router().bootstrap(ctx);
    ctx->cancel();

    if (!result) {
        for (const auto& cause : result.errors()) {
            out() << "  " << cause.to_string() << "\n";
        }
        return routing_failure("Bootstrap failed", result);
    }

    out() << "Bootstrap complete\n";
    return CommandResult::ok();
}

// RoutersCommandHandler Implementation
CommandResult RoutersCommandHandler::execute(const std::vector<std::string>&) {
    describe(router(), 0);
    return CommandResult::ok();
}

void RoutersCommandHandler::describe(const routing::Routing& router, int depth) const {
    std::string indent(static_cast<std::size_t>(depth) * 2, ' ');

    if (auto parallel = dynamic_cast<const routing::ComposableParallel*>(&router)) {
        out() << indent << "parallel\n";
        for (const auto& entry : parallel->routers()) {
            out() << indent << "- " << entry.describe() << "\n";
            describe(*entry.router, depth + 2);
        }
    } else if (auto sequential = dynamic_cast<const routing::ComposableSequential*>(&router)) {
        out() << indent << "sequential\n";
        for (const auto& entry : sequential->routers()) {
            out() << indent << "- " << entry.describe() << "\n";
            describe(*entry.router, depth + 2);
        }
    } else if (dynamic_cast<const routing::MemoryRouter*>(&router)) {
        out() << indent << "memory\n";
    } else if (dynamic_cast<const storage::SqliteRouter*>(&router)) {
        out() << indent << "sqlite\n";
    } else if (dynamic_cast<const routing::NullRouter*>(&router)) {
        out() << indent << "null\n";
    } else {
        out() << indent << "custom\n";
    }
}

}
