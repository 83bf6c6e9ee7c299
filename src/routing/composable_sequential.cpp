#include "routeweave/routing/composable_sequential.hpp"
#include "routeweave/core/logger.hpp"
#include <thread>

namespace routeweave::routing {

namespace {
    template<typename Call>
    RoutingResult guarded(const SequentialRouter& entry, Call&& call) {
        try {
            return call();
        } catch (const std::exception& e) {
            LOG_WARN("Router {} threw: {}", entry.describe(), e.what());
            return RoutingResult(RoutingError::BACKEND_FAILURE, e.what());
        }
    }

    // Ends the stream and drops buffered items once ctx is cancelled.
    template<typename T>
    ScopedCancelCallback discard_on_cancel(const ContextPtr& ctx, const ResultStreamPtr<T>& out) {
        std::weak_ptr<ResultStream<T>> weak_out = out;
        return ScopedCancelCallback(ctx, [weak_out] {
            if (auto stream = weak_out.lock()) {
                stream->close_and_discard();
            }
        });
    }
}

ComposableSequential::ComposableSequential(std::vector<SequentialRouter> routers)
    : routers_(std::move(routers))
{
    LOG_DEBUG("ComposableSequential created with {} routers", routers_.size());
}

template<typename Operation>
RoutingResult ComposableSequential::execute_sequential(const ContextPtr& ctx, Operation op) {
    for (const auto& entry : routers_) {
        if (ctx->done()) {
            return ctx->err();
        }
        
        auto router_ctx = router_context(ctx, entry.timeout);
        auto result = guarded(entry, [&] { return op(router_ctx, *entry.router); });
        router_ctx->cancel();
        
        if (!result && !entry.ignore_error) {
            return result;
        }
    }
    return RoutingResult();
}

template<typename T, typename Operation, typename IsEmpty>
RoutingResult ComposableSequential::get_value_sequential(const ContextPtr& ctx, Operation op,
                                                         IsEmpty is_empty, T& out) {
    for (const auto& entry : routers_) {
        if (ctx->done()) {
            return ctx->err();
        }
        
        T value{};
        auto router_ctx = router_context(ctx, entry.timeout);
        auto result = guarded(entry, [&] { return op(router_ctx, *entry.router, value); });
        router_ctx->cancel();
        
        if (!result) {
            if (result.is_not_found() || entry.ignore_error) {
                continue;
            }
            return result;
        }
        if (is_empty(value)) {
            continue;
        }
        
        out = std::move(value);
        return RoutingResult();
    }
    return RoutingResult::not_found();
}

RoutingResult ComposableSequential::provide(const ContextPtr& ctx, const ContentId& cid, bool announce) {
    return execute_sequential(ctx, [&cid, announce](const ContextPtr& router_ctx, Routing& router) {
        return router.provide(router_ctx, cid, announce);
    });
}

ResultStreamPtr<AddrInfo> ComposableSequential::find_providers_async(const ContextPtr& ctx, const ContentId& cid,
                                                                     int count) {
    auto out = ResultStream<AddrInfo>::create();
    auto routers = routers_;
    
    std::thread([ctx, cid, count, routers, out] {
        auto discard = discard_on_cancel(ctx, out);
        int delivered = 0;
        for (const auto& entry : routers) {
            if (ctx->done() || (count > 0 && delivered >= count)) {
                break;
            }
            
            auto router_ctx = router_context(ctx, entry.timeout);
            try {
                auto in = entry.router->find_providers_async(router_ctx, cid, count > 0 ? count - delivered : 0);
                while (in) {
                    auto addr = in->receive(router_ctx);
                    if (!addr || !out->send(std::move(*addr), ctx)) {
                        break;
                    }
                    if (count > 0 && ++delivered >= count) {
                        break;
                    }
                }
                if (in) {
                    in->close();
                }
            } catch (const std::exception& e) {
                LOG_WARN("Router {} threw while finding providers: {}", entry.describe(), e.what());
            }
            router_ctx->cancel();
        }
        out->close();
    }).detach();
    
    return out;
}

RoutingResult ComposableSequential::find_peer(const ContextPtr& ctx, const std::string& peer_id, AddrInfo& out) {
    return get_value_sequential<AddrInfo>(ctx,
        [&peer_id](const ContextPtr& router_ctx, Routing& router, AddrInfo& info) {
            return router.find_peer(router_ctx, peer_id, info);
        },
        [](const AddrInfo& info) { return info.empty(); },
        out);
}

RoutingResult ComposableSequential::put_value(const ContextPtr& ctx, const std::string& key, const Bytes& value,
                                              const RoutingOptions& options) {
    return execute_sequential(ctx, [&](const ContextPtr& router_ctx, Routing& router) {
        return router.put_value(router_ctx, key, value, options);
    });
}

RoutingResult ComposableSequential::get_value(const ContextPtr& ctx, const std::string& key,
                                              const RoutingOptions& options, Bytes& out) {
    return get_value_sequential<Bytes>(ctx,
        [&key, &options](const ContextPtr& router_ctx, Routing& router, Bytes& value) {
            return router.get_value(router_ctx, key, options, value);
        },
        [](const Bytes& value) { return value.empty(); },
        out);
}

RoutingResult ComposableSequential::search_value(const ContextPtr& ctx, const std::string& key,
                                                 const RoutingOptions& options, ResultStreamPtr<Bytes>& out) {
    if (ctx->done()) {
        return ctx->err();
    }
    
    auto stream = ResultStream<Bytes>::create();
    out = stream;
    auto routers = routers_;
    
    std::thread([ctx, key, options, routers, stream] {
        auto discard = discard_on_cancel(ctx, stream);
        std::size_t delivered = 0;
        for (const auto& entry : routers) {
            if (ctx->done()) {
                stream->close();
                return;
            }
            
            auto router_ctx = router_context(ctx, entry.timeout);
            ResultStreamPtr<Bytes> in;
            auto result = guarded(entry, [&] {
                return entry.router->search_value(router_ctx, key, options, in);
            });
            
            if (!result) {
                router_ctx->cancel();
                if (result.is_not_found() || entry.ignore_error) {
                    continue;
                }
                stream->close(std::move(result));
                return;
            }
            
            while (in) {
                auto value = in->receive(router_ctx);
                if (!value || !stream->send(std::move(*value), ctx)) {
                    break;
                }
                delivered++;
            }
            RoutingResult inner;
            if (in) {
                in->close();
                inner = in->error();
            }
            router_ctx->cancel();
            
            if (!inner && !inner.is_not_found() && !entry.ignore_error && !ctx->done()) {
                stream->close(std::move(inner));
                return;
            }
        }
        
        if (delivered == 0 && !ctx->done()) {
            stream->close(RoutingResult::not_found());
        } else {
            stream->close();
        }
    }).detach();
    
    return RoutingResult();
}

RoutingResult ComposableSequential::bootstrap(const ContextPtr& ctx) {
    return execute_sequential(ctx, [](const ContextPtr& router_ctx, Routing& router) {
        return router.bootstrap(router_ctx);
    });
}

}
