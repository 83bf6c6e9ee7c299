#include "routeweave/routing/composable_parallel.hpp"
#include "routeweave/routing/fan_out.hpp"
#include "routeweave/core/logger.hpp"
#include <atomic>
#include <thread>

namespace routeweave::routing {

namespace {
    struct FanInState {
        explicit FanInState(std::size_t tasks) : remaining(tasks) {}

        std::atomic<std::size_t> remaining;
        // Soft quota: incremented before delivery, never rolled back.
        std::atomic<std::int64_t> delivered{0};
        Context::CallbackId close_on_cancel = 0;
    };

    template<typename T>
    std::shared_ptr<FanInState> start_fan_in(const ContextPtr& ctx, const ResultStreamPtr<T>& out,
                                             std::size_t tasks) {
        auto state = std::make_shared<FanInState>(tasks);
        std::weak_ptr<ResultStream<T>> weak_out = out;
        state->close_on_cancel = ctx->on_cancel([weak_out] {
            if (auto stream = weak_out.lock()) {
                stream->close_and_discard();
            }
        });
        return state;
    }

    // Forwards items from in to out until in ends, ctx finishes, out is
    // closed or the quota is used up. Returns the number of items forwarded.
    template<typename T>
    std::int64_t forward(const ContextPtr& ctx, const ResultStreamPtr<T>& in, const ResultStreamPtr<T>& out,
                         FanInState& state, int count) {
        std::int64_t forwarded = 0;
        while (auto item = in->receive(ctx)) {
            auto position = state.delivered.fetch_add(1) + 1;
            if (count > 0 && position > count) {
                break;
            }
            if (!out->send(std::move(*item), ctx)) {
                break;
            }
            forwarded++;
        }
        in->close();
        return forwarded;
    }
}

ComposableParallel::ComposableParallel(std::vector<ParallelRouter> routers)
    : routers_(std::move(routers))
{
    LOG_DEBUG("ComposableParallel created with {} routers", routers_.size());
}

RoutingResult ComposableParallel::provide(const ContextPtr& ctx, const ContentId& cid, bool announce) {
    return fan_out::execute(ctx, routers_,
        [&cid, announce](const ContextPtr& router_ctx, Routing& router) {
            return router.provide(router_ctx, cid, announce);
        });
}

ResultStreamPtr<AddrInfo> ComposableParallel::find_providers_async(const ContextPtr& ctx, const ContentId& cid,
                                                                   int count) {
    auto out = ResultStream<AddrInfo>::create();
    if (routers_.empty()) {
        out->close();
        return out;
    }

    auto state = start_fan_in(ctx, out, routers_.size());

    for (const auto& entry : routers_) {
        std::thread([ctx, cid, count, entry, out, state] {
            if (!ctx->wait_for(entry.execute_after)) {
                auto router_ctx = router_context(ctx, entry.timeout);
                try {
                    auto in = entry.router->find_providers_async(router_ctx, cid, count);
                    if (in) {
                        auto forwarded = forward(router_ctx, in, out, *state, count);
                        LOG_DEBUG("Router {} delivered {} providers for {}", entry.describe(), forwarded, cid.to_hex());
                    }
                } catch (const std::exception& e) {
                    LOG_WARN("Router {} threw while finding providers: {}", entry.describe(), e.what());
                }
                router_ctx->cancel();
            }

            if (state->remaining.fetch_sub(1) == 1) {
                ctx->remove_callback(state->close_on_cancel);
                out->close();
            }
        }).detach();
    }

    return out;
}

RoutingResult ComposableParallel::find_peer(const ContextPtr& ctx, const std::string& peer_id, AddrInfo& out) {
    return fan_out::get_value_or_error<AddrInfo>(ctx, routers_,
        [peer_id](const ContextPtr& router_ctx, Routing& router, AddrInfo& info) {
            return router.find_peer(router_ctx, peer_id, info);
        },
        [](const AddrInfo& info) { return info.empty(); },
        out);
}

RoutingResult ComposableParallel::put_value(const ContextPtr& ctx, const std::string& key, const Bytes& value,
                                            const RoutingOptions& options) {
    return fan_out::execute(ctx, routers_,
        [&key, &value, &options](const ContextPtr& router_ctx, Routing& router) {
            return router.put_value(router_ctx, key, value, options);
        });
}

RoutingResult ComposableParallel::get_value(const ContextPtr& ctx, const std::string& key,
                                            const RoutingOptions& options, Bytes& out) {
    return fan_out::get_value_or_error<Bytes>(ctx, routers_,
        [key, options](const ContextPtr& router_ctx, Routing& router, Bytes& value) {
            return router.get_value(router_ctx, key, options, value);
        },
        [](const Bytes& value) { return value.empty(); },
        out);
}

RoutingResult ComposableParallel::search_value(const ContextPtr& ctx, const std::string& key,
                                               const RoutingOptions& options, ResultStreamPtr<Bytes>& out) {
    if (ctx->done()) {
        return ctx->err();
    }

    auto stream = ResultStream<Bytes>::create();
    out = stream;
    if (routers_.empty()) {
        stream->close(RoutingResult::not_found());
        return RoutingResult();
    }

    auto state = start_fan_in(ctx, stream, routers_.size());

    for (const auto& entry : routers_) {
        std::thread([ctx, key, options, entry, stream, state] {
            if (!ctx->wait_for(entry.execute_after)) {
                auto router_ctx = router_context(ctx, entry.timeout);
                ResultStreamPtr<Bytes> in;
                auto result = fan_out::invoke_guarded(entry, [&] {
                    return entry.router->search_value(router_ctx, key, options, in);
                });

                if (!result) {
                    if (!result.is_not_found() && !entry.ignore_error) {
                        LOG_WARN("Router {} failed to search {}: {}", entry.describe(), key, result.to_string());
                        stream->set_error(std::move(result));
                    }
                } else if (in) {
                    forward(router_ctx, in, stream, *state, 0);
                    auto inner = in->error();
                    if (!inner && !inner.is_not_found() && !entry.ignore_error && !ctx->done()) {
                        LOG_WARN("Router {} ended search for {} with: {}", entry.describe(), key, inner.to_string());
                        stream->set_error(std::move(inner));
                    }
                }
                router_ctx->cancel();
            }

            if (state->remaining.fetch_sub(1) == 1) {
                ctx->remove_callback(state->close_on_cancel);
                if (!ctx->done() && state->delivered.load() == 0) {
                    stream->close(RoutingResult::not_found());
                } else {
                    stream->close();
                }
            }
        }).detach();
    }

    return RoutingResult();
}

RoutingResult ComposableParallel::bootstrap(const ContextPtr& ctx) {
    return fan_out::execute(ctx, routers_,
        [](const ContextPtr& router_ctx, Routing& router) {
            return router.bootstrap(router_ctx);
        });
}

RoutingResult ComposableParallel::provide_many(const ContextPtr& ctx, const std::vector<ContentId>& keys) {
    auto batch = batch_routers();
    if (batch.empty()) {
        return RoutingResult::not_supported("no router supports batch provide");
    }

    return fan_out::execute(ctx, batch,
        [&keys](const ContextPtr& router_ctx, Routing& router) {
            return dynamic_cast<ProvideManyRouter&>(router).provide_many(router_ctx, keys);
        });
}

bool ComposableParallel::ready() const {
    auto batch = batch_routers();
    if (batch.empty()) {
        return false;
    }

    for (const auto& entry : batch) {
        if (!dynamic_cast<ProvideManyRouter&>(*entry.router).ready()) {
            return false;
        }
    }
    return true;
}

std::vector<ParallelRouter> ComposableParallel::batch_routers() const {
    std::vector<ParallelRouter> batch;
    for (const auto& entry : routers_) {
        if (dynamic_cast<ProvideManyRouter*>(entry.router.get()) == nullptr) {
            continue;
        }
        auto* nested = dynamic_cast<ComposableParallel*>(entry.router.get());
        if (nested && nested->batch_routers().empty()) {
            continue;
        }
        batch.push_back(entry);
    }
    return batch;
}

}
