#pragma once

#include <gmock/gmock.h>
#include "routeweave/routing/routing.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

namespace routeweave::test_support {

using namespace routeweave::routing;

struct RouterStats {
    std::atomic<int> calls{0};
    std::atomic<int> active{0};
    std::atomic<int> cancelled{0};
};

// Backend whose behaviour is fixed up front: how long it takes, what it
// returns and what it streams. Configure before handing it to a composite.
class ScriptedRouter : public Routing {
public:
    std::chrono::milliseconds delay{0};
    std::chrono::milliseconds item_delay{0};
    RoutingResult result;
    Bytes value;
    AddrInfo peer;
    std::vector<AddrInfo> providers;
    std::vector<Bytes> values;
    bool throws = false;
    std::shared_ptr<RouterStats> stats = std::make_shared<RouterStats>();

    RoutingResult provide(const ContextPtr& ctx, const ContentId&, bool) override {
        return run(ctx);
    }

    ResultStreamPtr<AddrInfo> find_providers_async(const ContextPtr& ctx, const ContentId&, int) override {
        stats->calls++;
        auto out = ResultStream<AddrInfo>::create(1);
        stream_items(ctx, out, providers);
        return out;
    }

    RoutingResult find_peer(const ContextPtr& ctx, const std::string&, AddrInfo& out) override {
        auto outcome = run(ctx);
        if (outcome) {
            out = peer;
        }
        return outcome;
    }

    RoutingResult put_value(const ContextPtr& ctx, const std::string&, const Bytes&,
                            const RoutingOptions&) override {
        return run(ctx);
    }

    RoutingResult get_value(const ContextPtr& ctx, const std::string&, const RoutingOptions&,
                            Bytes& out) override {
        auto outcome = run(ctx);
        if (outcome) {
            out = value;
        }
        return outcome;
    }

    RoutingResult search_value(const ContextPtr& ctx, const std::string&, const RoutingOptions&,
                               ResultStreamPtr<Bytes>& out) override {
        auto outcome = run(ctx);
        if (!outcome) {
            return outcome;
        }
        out = ResultStream<Bytes>::create(1);
        stream_items(ctx, out, values);
        return outcome;
    }

    RoutingResult bootstrap(const ContextPtr& ctx) override {
        return run(ctx);
    }

private:
    RoutingResult run(const ContextPtr& ctx) {
        stats->calls++;
        stats->active++;
        struct Leave {
            std::shared_ptr<RouterStats> stats;
            ~Leave() { stats->active--; }
        } leave{stats};

        if (throws) {
            throw std::runtime_error("scripted failure");
        }
        if (ctx->wait_for(delay)) {
            stats->cancelled++;
            return ctx->err();
        }
        return result;
    }

    template<typename T>
    void stream_items(const ContextPtr& ctx, const ResultStreamPtr<T>& out, std::vector<T> items) {
        stats->active++;
        std::thread([ctx, out, items = std::move(items), counters = stats, pause = item_delay] {
            for (const auto& item : items) {
                if (ctx->wait_for(pause)) {
                    counters->cancelled++;
                    break;
                }
                if (!out->send(item, ctx)) {
                    break;
                }
            }
            out->close();
            counters->active--;
        }).detach();
    }
};

class MockRouter : public Routing {
public:
    MOCK_METHOD(RoutingResult, provide, (const ContextPtr&, const ContentId&, bool), (override));
    MOCK_METHOD(ResultStreamPtr<AddrInfo>, find_providers_async, (const ContextPtr&, const ContentId&, int), (override));
    MOCK_METHOD(RoutingResult, find_peer, (const ContextPtr&, const std::string&, AddrInfo&), (override));
    MOCK_METHOD(RoutingResult, put_value, (const ContextPtr&, const std::string&, const Bytes&, const RoutingOptions&), (override));
    MOCK_METHOD(RoutingResult, get_value, (const ContextPtr&, const std::string&, const RoutingOptions&, Bytes&), (override));
    MOCK_METHOD(RoutingResult, search_value, (const ContextPtr&, const std::string&, const RoutingOptions&, ResultStreamPtr<Bytes>&), (override));
    MOCK_METHOD(RoutingResult, bootstrap, (const ContextPtr&), (override));
};

inline Bytes to_bytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

inline AddrInfo peer_info(const std::string& id) {
    return AddrInfo{id, {"/ip4/127.0.0.1/tcp/4001"}};
}

inline std::vector<AddrInfo> numbered_peers(const std::string& prefix, int n) {
    std::vector<AddrInfo> peers;
    for (int i = 0; i < n; ++i) {
        peers.push_back(peer_info(prefix + std::to_string(i)));
    }
    return peers;
}

// Polls until pred holds or the timeout elapses.
inline bool eventually(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
    auto until = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < until) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

}
