#pragma once

#include "routeweave/core/logger.hpp"
#include "routeweave/routing/context.hpp"
#include "routeweave/routing/router_entry.hpp"
#include "routeweave/routing/routing.hpp"
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace routeweave::routing::fan_out {

// Runs a backend call, turning escaping exceptions into BACKEND_FAILURE.
template<typename Call>
RoutingResult invoke_guarded(const ParallelRouter& entry, Call&& call) {
    try {
        return call();
    } catch (const std::exception& e) {
        LOG_WARN("Router {} threw: {}", entry.describe(), e.what());
        return RoutingResult(RoutingError::BACKEND_FAILURE, e.what());
    }
}

// Require-all reduction. Every entry runs on its own thread; the call returns
// once all of them finished, with every non-ignored failure aggregated in
// arrival order. Siblings are never cancelled because one of them failed.
//
// Operation: RoutingResult(const ContextPtr&, Routing&)
template<typename Operation>
RoutingResult execute(const ContextPtr& ctx, const std::vector<ParallelRouter>& routers, Operation op) {
    std::mutex errors_mutex;
    RoutingResult aggregate;

    auto record = [&errors_mutex, &aggregate](RoutingResult err) {
        std::lock_guard<std::mutex> lock(errors_mutex);
        aggregate = RoutingResult::append(std::move(aggregate), std::move(err));
    };

    std::vector<std::thread> tasks;
    tasks.reserve(routers.size());

    for (const auto& entry : routers) {
        tasks.emplace_back([&ctx, &entry, &op, &record] {
            if (ctx->wait_for(entry.execute_after)) {
                if (!entry.ignore_error) {
                    record(ctx->err());
                }
                LOG_DEBUG("Router {} abandoned before start: {}", entry.describe(), ctx->err().to_string());
                return;
            }

            auto router_ctx = router_context(ctx, entry.timeout);
            auto result = invoke_guarded(entry, [&] { return op(router_ctx, *entry.router); });
            router_ctx->cancel();

            if (result) {
                return;
            }
            if (entry.ignore_error) {
                LOG_DEBUG("Ignoring error from router {}: {}", entry.describe(), result.to_string());
                return;
            }
            LOG_WARN("Router {} failed: {}", entry.describe(), result.to_string());
            record(std::move(result));
        });
    }

    for (auto& task : tasks) {
        task.join();
    }

    return aggregate;
}

template<typename T>
struct RaceState {
    explicit RaceState(std::size_t tasks) : remaining(tasks) {}

    void offer_value(T candidate) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (decided) {
                return;
            }
            decided = true;
            value = std::move(candidate);
        }
        cv.notify_all();
    }

    void offer_error(RoutingResult err) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (decided) {
                return;
            }
            decided = true;
            error = std::move(err);
        }
        cv.notify_all();
    }

    void finish_task() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            --remaining;
        }
        cv.notify_all();
    }

    std::mutex mutex;
    std::condition_variable cv;
    bool decided = false;
    std::optional<T> value;
    RoutingResult error;
    std::size_t remaining;
};

// Race reduction. Returns the first non-empty value any entry produces and
// cancels the others. NOT_FOUND and empty values are soft misses; a hard,
// non-ignored error ends the race with that error. When every entry missed
// the result is NOT_FOUND.
//
// Tasks may outlive this call (they exit once the race scope is cancelled),
// so op and is_empty are copied into every task and must capture by value.
//
// Operation: RoutingResult(const ContextPtr&, Routing&, T&)
// IsEmpty:   bool(const T&)
template<typename T, typename Operation, typename IsEmpty>
RoutingResult get_value_or_error(const ContextPtr& ctx, const std::vector<ParallelRouter>& routers,
                                 Operation op, IsEmpty is_empty, T& out) {
    auto state = std::make_shared<RaceState<T>>(routers.size());
    auto race_ctx = Context::with_cancel(ctx);

    for (const auto& entry : routers) {
        std::thread([state, race_ctx, entry, op, is_empty] {
            if (race_ctx->wait_for(entry.execute_after)) {
                if (!entry.ignore_error) {
                    state->offer_error(race_ctx->err());
                }
                state->finish_task();
                return;
            }

            T value{};
            auto router_ctx = router_context(race_ctx, entry.timeout);
            auto result = invoke_guarded(entry, [&] { return op(router_ctx, *entry.router, value); });
            router_ctx->cancel();

            if (!result) {
                if (result.is_not_found()) {
                    LOG_DEBUG("Router {} has no value", entry.describe());
                } else if (entry.ignore_error) {
                    LOG_DEBUG("Ignoring error from router {}: {}", entry.describe(), result.to_string());
                } else if (!race_ctx->done()) {
                    LOG_WARN("Router {} failed: {}", entry.describe(), result.to_string());
                    state->offer_error(std::move(result));
                }
            } else if (!is_empty(value)) {
                state->offer_value(std::move(value));
            }

            state->finish_task();
        }).detach();
    }

    RoutingResult outcome;
    {
        std::weak_ptr<RaceState<T>> weak_state = state;
        ScopedCancelCallback wake(ctx, [weak_state] {
            if (auto s = weak_state.lock()) {
                std::lock_guard<std::mutex> lock(s->mutex);
                s->cv.notify_all();
            }
        });

        std::unique_lock<std::mutex> lock(state->mutex);
        auto ready = [&state, &ctx] { return state->decided || state->remaining == 0 || ctx->done(); };
        if (auto deadline = ctx->deadline()) {
            state->cv.wait_until(lock, *deadline, ready);
        } else {
            state->cv.wait(lock, ready);
        }

        if (state->decided && state->value) {
            out = std::move(*state->value);
        } else if (state->decided) {
            outcome = state->error;
        } else if (ctx->done()) {
            outcome = ctx->err();
        } else {
            outcome = RoutingResult::not_found();
        }
        state->decided = true;
    }

    race_ctx->cancel();
    return outcome;
}

}
