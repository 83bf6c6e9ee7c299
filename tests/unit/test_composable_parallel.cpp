#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "routeweave/routing/composable_parallel.hpp"
#include "routeweave/routing/memory_router.hpp"
#include "routeweave/routing/null_router.hpp"
#include "scripted_router.hpp"
#include <chrono>
#include <thread>

using namespace routeweave::routing;
using namespace routeweave::test_support;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Return;

namespace {
    const ContentId TEST_CID = ContentId::from_hex("a0e40220aabbccdd");

    ParallelRouter entry(std::shared_ptr<Routing> router, std::string name,
                         std::chrono::milliseconds timeout = 0ms,
                         std::chrono::milliseconds execute_after = 0ms,
                         bool ignore_error = false) {
        ParallelRouter e;
        e.router = std::move(router);
        e.name = std::move(name);
        e.timeout = timeout;
        e.execute_after = execute_after;
        e.ignore_error = ignore_error;
        return e;
    }

    std::shared_ptr<ScriptedRouter> failing(RoutingError error, const std::string& message) {
        auto router = std::make_shared<ScriptedRouter>();
        router->result = RoutingResult(error, message);
        return router;
    }
}

class ComposableParallelTest : public ::testing::Test {
protected:
    ContextPtr ctx_ = Context::with_cancel(Context::background());
    
    void TearDown() override {
        ctx_->cancel();
    }
};

TEST_F(ComposableParallelTest, PutValueSucceedsWhenEveryRouterSucceeds) {
    auto a = std::make_shared<MemoryRouter>(peer_info("a"));
    auto b = std::make_shared<MemoryRouter>(peer_info("b"));
    auto c = std::make_shared<ScriptedRouter>();
    ComposableParallel router({entry(a, "a"), entry(b, "b"), entry(c, "c")});
    
    auto result = router.put_value(ctx_, "/v/key", to_bytes("value"), RoutingOptions{});
    
    EXPECT_TRUE(result) << result.to_string();
    EXPECT_EQ(a->value_count(), 1);
    EXPECT_EQ(b->value_count(), 1);
    EXPECT_EQ(c->stats->calls.load(), 1);
}

TEST_F(ComposableParallelTest, SingleFailureIsReturnedAfterOthersApplied) {
    auto a = std::make_shared<MemoryRouter>(peer_info("a"));
    auto b = failing(RoutingError::BACKEND_FAILURE, "b is down");
    auto c = std::make_shared<MemoryRouter>(peer_info("c"));
    ComposableParallel router({entry(a, "a"), entry(b, "b"), entry(c, "c")});
    
    auto result = router.put_value(ctx_, "/v/key", to_bytes("value"), RoutingOptions{});
    
    EXPECT_EQ(result.error, RoutingError::BACKEND_FAILURE);
    EXPECT_EQ(result.message, "b is down");
    // Writes are not rolled back.
    EXPECT_EQ(a->value_count(), 1);
    EXPECT_EQ(c->value_count(), 1);
}

TEST_F(ComposableParallelTest, IgnoredFailureIsSwallowed) {
    auto a = std::make_shared<ScriptedRouter>();
    auto b = failing(RoutingError::BACKEND_FAILURE, "b is down");
    ComposableParallel router({entry(a, "a"), entry(b, "b", 0ms, 0ms, true)});
    
    EXPECT_TRUE(router.provide(ctx_, TEST_CID, true));
    EXPECT_EQ(b->stats->calls.load(), 1);
}

TEST_F(ComposableParallelTest, FailuresAreAggregated) {
    auto a = failing(RoutingError::BACKEND_FAILURE, "a failed");
    auto b = std::make_shared<ScriptedRouter>();
    auto c = failing(RoutingError::STORAGE_FAILURE, "c failed");
    ComposableParallel router({entry(a, "a"), entry(b, "b"), entry(c, "c")});
    
    auto result = router.bootstrap(ctx_);
    
    EXPECT_EQ(result.error, RoutingError::MULTIPLE);
    auto errors = result.errors();
    ASSERT_EQ(errors.size(), 2);
    std::vector<std::string> messages{errors[0].message, errors[1].message};
    EXPECT_THAT(messages, ::testing::UnorderedElementsAre("a failed", "c failed"));
}

TEST_F(ComposableParallelTest, ExceptionBecomesBackendFailure) {
    auto a = std::make_shared<ScriptedRouter>();
    a->throws = true;
    ComposableParallel router({entry(a, "a")});
    
    auto result = router.put_value(ctx_, "/v/key", to_bytes("value"), RoutingOptions{});
    
    EXPECT_EQ(result.error, RoutingError::BACKEND_FAILURE);
    EXPECT_EQ(result.message, "scripted failure");
}

TEST_F(ComposableParallelTest, StartDelayBeyondDeadlineReportsDeadline) {
    auto fast = std::make_shared<ScriptedRouter>();
    auto late = std::make_shared<ScriptedRouter>();
    ComposableParallel router({entry(fast, "fast"), entry(late, "late", 0ms, 10s)});
    
    auto ctx = Context::with_timeout(ctx_, 50ms);
    auto start = std::chrono::steady_clock::now();
    auto result = router.provide(ctx, TEST_CID, true);
    
    EXPECT_EQ(result.error, RoutingError::DEADLINE_EXCEEDED);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_EQ(fast->stats->calls.load(), 1);
    EXPECT_EQ(late->stats->calls.load(), 0);
}

TEST_F(ComposableParallelTest, StartDelayBeyondDeadlineIgnored) {
    auto fast = std::make_shared<ScriptedRouter>();
    auto late = std::make_shared<ScriptedRouter>();
    ComposableParallel router({entry(fast, "fast"), entry(late, "late", 0ms, 10s, true)});
    
    auto ctx = Context::with_timeout(ctx_, 50ms);
    EXPECT_TRUE(router.provide(ctx, TEST_CID, true));
    EXPECT_EQ(late->stats->calls.load(), 0);
}

TEST_F(ComposableParallelTest, ExecuteAfterDelaysStart) {
    auto delayed = std::make_shared<ScriptedRouter>();
    ComposableParallel router({entry(delayed, "delayed", 0ms, 60ms)});
    
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(router.bootstrap(ctx_));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 55ms);
    EXPECT_EQ(delayed->stats->calls.load(), 1);
}

TEST_F(ComposableParallelTest, RouterTimeoutBoundsSlowRouter) {
    auto slow = std::make_shared<ScriptedRouter>();
    slow->delay = 10s;
    ComposableParallel router({entry(slow, "slow", 30ms)});
    
    auto start = std::chrono::steady_clock::now();
    auto result = router.put_value(ctx_, "/v/key", to_bytes("value"), RoutingOptions{});
    
    EXPECT_EQ(result.error, RoutingError::DEADLINE_EXCEEDED);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_FALSE(ctx_->done());
}

TEST_F(ComposableParallelTest, GetValueReturnsFirstAnswerAndCancelsOthers) {
    auto fast = std::make_shared<ScriptedRouter>();
    fast->delay = 10ms;
    fast->value = to_bytes("fast");
    auto slow = std::make_shared<ScriptedRouter>();
    slow->delay = 10s;
    slow->value = to_bytes("slow");
    ComposableParallel router({entry(fast, "fast"), entry(slow, "slow")});
    
    Bytes value;
    auto start = std::chrono::steady_clock::now();
    auto result = router.get_value(ctx_, "/v/key", RoutingOptions{}, value);
    
    EXPECT_TRUE(result) << result.to_string();
    EXPECT_EQ(value, to_bytes("fast"));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_TRUE(eventually([&] { return slow->stats->cancelled.load() == 1; }));
    EXPECT_TRUE(eventually([&] { return slow->stats->active.load() == 0; }));
}

TEST_F(ComposableParallelTest, GetValueSkipsMissesAndEmptyValues) {
    auto missing = failing(RoutingError::NOT_FOUND, "routing: not found");
    auto empty = std::make_shared<ScriptedRouter>();
    auto holder = std::make_shared<ScriptedRouter>();
    holder->delay = 30ms;
    holder->value = to_bytes("found");
    ComposableParallel router({entry(missing, "missing"), entry(empty, "empty"), entry(holder, "holder")});
    
    Bytes value;
    EXPECT_TRUE(router.get_value(ctx_, "/v/key", RoutingOptions{}, value));
    EXPECT_EQ(value, to_bytes("found"));
}

TEST_F(ComposableParallelTest, GetValueAllMissesIsNotFound) {
    auto missing = failing(RoutingError::NOT_FOUND, "routing: not found");
    auto empty = std::make_shared<ScriptedRouter>();
    auto ignored = failing(RoutingError::BACKEND_FAILURE, "ignored");
    ComposableParallel router({entry(missing, "missing"), entry(empty, "empty"),
                               entry(ignored, "ignored", 0ms, 0ms, true)});
    
    Bytes value;
    auto result = router.get_value(ctx_, "/v/key", RoutingOptions{}, value);
    
    EXPECT_TRUE(result.is_not_found());
    EXPECT_TRUE(value.empty());
}

TEST_F(ComposableParallelTest, GetValueHardErrorEndsRace) {
    auto broken = failing(RoutingError::BACKEND_FAILURE, "broken");
    auto slow = std::make_shared<ScriptedRouter>();
    slow->delay = 10s;
    slow->value = to_bytes("late");
    ComposableParallel router({entry(broken, "broken"), entry(slow, "slow")});
    
    Bytes value;
    auto result = router.get_value(ctx_, "/v/key", RoutingOptions{}, value);
    
    EXPECT_EQ(result.error, RoutingError::BACKEND_FAILURE);
    EXPECT_TRUE(value.empty());
    EXPECT_TRUE(eventually([&] { return slow->stats->active.load() == 0; }));
}

TEST_F(ComposableParallelTest, GetValueCallerCancellation) {
    auto slow = std::make_shared<ScriptedRouter>();
    slow->delay = 10s;
    ComposableParallel router({entry(slow, "slow")});
    
    std::thread canceller([this] {
        std::this_thread::sleep_for(30ms);
        ctx_->cancel();
    });
    
    Bytes value;
    auto result = router.get_value(ctx_, "/v/key", RoutingOptions{}, value);
    canceller.join();
    
    EXPECT_EQ(result.error, RoutingError::CANCELLED);
    EXPECT_TRUE(eventually([&] { return slow->stats->active.load() == 0; }));
}

TEST_F(ComposableParallelTest, FindPeerUsesAnyRouter) {
    auto empty = std::make_shared<MemoryRouter>(AddrInfo{});
    auto book = std::make_shared<MemoryRouter>(AddrInfo{});
    book->add_peer(peer_info("remote"));
    ComposableParallel router({entry(empty, "empty"), entry(book, "book")});
    
    AddrInfo info;
    EXPECT_TRUE(router.find_peer(ctx_, "remote", info));
    EXPECT_EQ(info, peer_info("remote"));
    
    AddrInfo unknown;
    EXPECT_TRUE(router.find_peer(ctx_, "nobody", unknown).is_not_found());
}

TEST_F(ComposableParallelTest, FindProvidersMergesAllRouters) {
    std::vector<ParallelRouter> routers;
    std::vector<std::shared_ptr<ScriptedRouter>> backends;
    for (int i = 0; i < 3; ++i) {
        auto backend = std::make_shared<ScriptedRouter>();
        backend->providers = numbered_peers("r" + std::to_string(i) + "-", 5);
        backends.push_back(backend);
        routers.push_back(entry(backend, "r" + std::to_string(i)));
    }
    ComposableParallel router(std::move(routers));
    
    auto providers = router.find_providers_async(ctx_, TEST_CID, 0)->drain();
    
    EXPECT_EQ(providers.size(), 15);
}

TEST_F(ComposableParallelTest, FindProvidersHonorsCount) {
    std::vector<ParallelRouter> routers;
    std::vector<std::shared_ptr<ScriptedRouter>> backends;
    for (int i = 0; i < 3; ++i) {
        auto backend = std::make_shared<ScriptedRouter>();
        backend->providers = numbered_peers("r" + std::to_string(i) + "-", 5);
        backends.push_back(backend);
        routers.push_back(entry(backend, "r" + std::to_string(i)));
    }
    ComposableParallel router(std::move(routers));
    
    auto providers = router.find_providers_async(ctx_, TEST_CID, 2)->drain();
    
    EXPECT_EQ(providers.size(), 2);
    for (const auto& backend : backends) {
        EXPECT_TRUE(eventually([&] { return backend->stats->active.load() == 0; }));
    }
}

TEST_F(ComposableParallelTest, FindProvidersCancellationEndsStreamAndTasks) {
    std::vector<ParallelRouter> routers;
    std::vector<std::shared_ptr<ScriptedRouter>> backends;
    for (int i = 0; i < 3; ++i) {
        auto backend = std::make_shared<ScriptedRouter>();
        backend->providers = numbered_peers("r" + std::to_string(i) + "-", 100);
        backend->item_delay = 20ms;
        backends.push_back(backend);
        routers.push_back(entry(backend, "r" + std::to_string(i), 0ms, std::chrono::milliseconds(i * 10)));
    }
    ComposableParallel router(std::move(routers));
    
    auto stream = router.find_providers_async(ctx_, TEST_CID, 0);
    ASSERT_TRUE(stream->receive().has_value());
    
    // Let the merged buffer fill up before cancelling.
    EXPECT_TRUE(eventually([&] { return stream->buffered() == ResultStream<AddrInfo>::DEFAULT_CAPACITY; }));
    ctx_->cancel();
    
    auto rest = stream->drain();
    EXPECT_TRUE(rest.empty());
    EXPECT_TRUE(stream->closed());
    for (const auto& backend : backends) {
        EXPECT_TRUE(eventually([&] { return backend->stats->active.load() == 0; }));
    }
}

TEST_F(ComposableParallelTest, FindProvidersWithNoRouters) {
    ComposableParallel router(std::vector<ParallelRouter>{});
    EXPECT_TRUE(router.find_providers_async(ctx_, TEST_CID, 0)->drain().empty());
}

TEST_F(ComposableParallelTest, SearchValueMergesValues) {
    auto a = std::make_shared<ScriptedRouter>();
    a->values = {to_bytes("v1"), to_bytes("v2")};
    auto b = std::make_shared<ScriptedRouter>();
    b->values = {to_bytes("v3")};
    auto missing = failing(RoutingError::NOT_FOUND, "routing: not found");
    ComposableParallel router({entry(a, "a"), entry(b, "b"), entry(missing, "missing")});
    
    ResultStreamPtr<Bytes> stream;
    ASSERT_TRUE(router.search_value(ctx_, "/v/key", RoutingOptions{}, stream));
    
    auto values = stream->drain();
    EXPECT_THAT(values, ::testing::UnorderedElementsAre(to_bytes("v1"), to_bytes("v2"), to_bytes("v3")));
    EXPECT_TRUE(stream->error());
}

TEST_F(ComposableParallelTest, SearchValueNothingFound) {
    auto missing = failing(RoutingError::NOT_FOUND, "routing: not found");
    auto null_router = std::make_shared<NullRouter>();
    ComposableParallel router({entry(missing, "missing"), entry(null_router, "null")});
    
    ResultStreamPtr<Bytes> stream;
    ASSERT_TRUE(router.search_value(ctx_, "/v/key", RoutingOptions{}, stream));
    
    EXPECT_TRUE(stream->drain().empty());
    EXPECT_TRUE(stream->error().is_not_found());
}

TEST_F(ComposableParallelTest, SearchValueHardFailureBecomesTerminalError) {
    auto broken = failing(RoutingError::BACKEND_FAILURE, "broken");
    auto good = std::make_shared<ScriptedRouter>();
    good->delay = 20ms;
    good->values = {to_bytes("v1")};
    ComposableParallel router({entry(broken, "broken"), entry(good, "good")});
    
    ResultStreamPtr<Bytes> stream;
    ASSERT_TRUE(router.search_value(ctx_, "/v/key", RoutingOptions{}, stream));
    
    EXPECT_EQ(stream->drain(), std::vector<Bytes>{to_bytes("v1")});
    EXPECT_EQ(stream->error().error, RoutingError::BACKEND_FAILURE);
}

TEST_F(ComposableParallelTest, SearchValueCancellationDropsBufferedValues) {
    auto backend = std::make_shared<ScriptedRouter>();
    for (int i = 0; i < 50; ++i) {
        backend->values.push_back(to_bytes("v" + std::to_string(i)));
    }
    ComposableParallel router({entry(backend, "a")});
    
    ResultStreamPtr<Bytes> stream;
    ASSERT_TRUE(router.search_value(ctx_, "/v/key", RoutingOptions{}, stream));
    EXPECT_TRUE(eventually([&] { return stream->buffered() == ResultStream<Bytes>::DEFAULT_CAPACITY; }));
    
    ctx_->cancel();
    
    EXPECT_FALSE(stream->receive().has_value());
    EXPECT_TRUE(stream->closed());
    EXPECT_TRUE(eventually([&] { return backend->stats->active.load() == 0; }));
}

TEST_F(ComposableParallelTest, NestedSearchFailureKeepsItsError) {
    auto broken = failing(RoutingError::BACKEND_FAILURE, "broken");
    auto inner = std::make_shared<ComposableParallel>(std::vector<ParallelRouter>{entry(broken, "broken")});
    ComposableParallel router({entry(inner, "inner")});
    
    ResultStreamPtr<Bytes> stream;
    ASSERT_TRUE(router.search_value(ctx_, "/v/key", RoutingOptions{}, stream));
    
    EXPECT_TRUE(stream->drain().empty());
    EXPECT_EQ(stream->error().error, RoutingError::BACKEND_FAILURE);
}

TEST_F(ComposableParallelTest, NestedSearchFailureIgnoredByEntry) {
    auto broken = failing(RoutingError::BACKEND_FAILURE, "broken");
    auto inner = std::make_shared<ComposableParallel>(std::vector<ParallelRouter>{entry(broken, "broken")});
    ComposableParallel router({entry(inner, "inner", 0ms, 0ms, true)});
    
    ResultStreamPtr<Bytes> stream;
    ASSERT_TRUE(router.search_value(ctx_, "/v/key", RoutingOptions{}, stream));
    
    EXPECT_TRUE(stream->drain().empty());
    EXPECT_TRUE(stream->error().is_not_found());
}

TEST_F(ComposableParallelTest, SearchValueOnFinishedContext) {
    ComposableParallel router({entry(std::make_shared<ScriptedRouter>(), "a")});
    ctx_->cancel();
    
    ResultStreamPtr<Bytes> stream;
    auto result = router.search_value(ctx_, "/v/key", RoutingOptions{}, stream);
    
    EXPECT_EQ(result.error, RoutingError::CANCELLED);
    EXPECT_EQ(stream, nullptr);
}

TEST_F(ComposableParallelTest, ProvideManyNeedsBatchRouter) {
    ComposableParallel plain({entry(std::make_shared<ScriptedRouter>(), "a")});
    EXPECT_EQ(plain.provide_many(ctx_, {TEST_CID}).error, RoutingError::NOT_SUPPORTED);
    EXPECT_FALSE(plain.ready());
    
    auto memory = std::make_shared<MemoryRouter>(peer_info("self"));
    auto other = std::make_shared<ScriptedRouter>();
    ComposableParallel mixed({entry(memory, "memory"), entry(other, "other")});
    
    EXPECT_TRUE(mixed.ready());
    EXPECT_TRUE(mixed.provide_many(ctx_, {TEST_CID}));
    EXPECT_EQ(memory->provider_count(TEST_CID), 1);
    EXPECT_EQ(other->stats->calls.load(), 0);
}

TEST_F(ComposableParallelTest, MockRoutersAreEachBootstrappedOnce) {
    auto first = std::make_shared<MockRouter>();
    auto second = std::make_shared<MockRouter>();
    EXPECT_CALL(*first, bootstrap(_)).WillOnce(Return(RoutingResult()));
    EXPECT_CALL(*second, bootstrap(_)).WillOnce(Return(RoutingResult(RoutingError::NOT_SUPPORTED, "no")));
    
    ComposableParallel router({entry(first, "first"), entry(second, "second")});
    auto result = router.bootstrap(ctx_);
    
    EXPECT_EQ(result.error, RoutingError::NOT_SUPPORTED);
}
