#include <benchmark/benchmark.h>
#include "routeweave/crypto/content_hash.hpp"
#include "routeweave/routing/composable_parallel.hpp"
#include "routeweave/routing/composable_sequential.hpp"
#include "routeweave/routing/memory_router.hpp"
#include "routeweave/routing/result_stream.hpp"
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace routeweave::routing;

class RoutingBenchmarkFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& state) override {
        routeweave::crypto::initialize();
        
        cid_ = routeweave::crypto::content_id_for(std::string("benchmark content"));
        value_ = Bytes(256, 0x42);
        
        std::vector<ParallelRouter> parallel;
        std::vector<SequentialRouter> sequential;
        for (int i = 0; i < static_cast<int>(state.range(0)); ++i) {
            auto memory = std::make_shared<MemoryRouter>(AddrInfo{"peer-" + std::to_string(i), {}});
            for (int p = 0; p < 8; ++p) {
                memory->add_provider(cid_, AddrInfo{"provider-" + std::to_string(i) + "-" + std::to_string(p), {}});
            }
            
            ParallelRouter p_entry;
            p_entry.router = memory;
            p_entry.name = "memory-" + std::to_string(i);
            parallel.push_back(p_entry);
            
            SequentialRouter s_entry;
            s_entry.router = memory;
            s_entry.name = p_entry.name;
            sequential.push_back(s_entry);
        }
        
        parallel_ = std::make_unique<ComposableParallel>(std::move(parallel));
        sequential_ = std::make_unique<ComposableSequential>(std::move(sequential));
        ctx_ = Context::with_cancel(Context::background());
        parallel_->put_value(ctx_, "/v/bench", value_, RoutingOptions{});
    }
    
    void TearDown(const ::benchmark::State&) override {
        ctx_->cancel();
        parallel_.reset();
        sequential_.reset();
    }
    
protected:
    ContentId cid_;
    Bytes value_;
    ContextPtr ctx_;
    std::unique_ptr<ComposableParallel> parallel_;
    std::unique_ptr<ComposableSequential> sequential_;
};

BENCHMARK_DEFINE_F(RoutingBenchmarkFixture, Parallel_PutValue)(benchmark::State& state) {
    for (auto _ : state) {
        auto result = parallel_->put_value(ctx_, "/v/bench", value_, RoutingOptions{});
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK_REGISTER_F(RoutingBenchmarkFixture, Parallel_PutValue)->Arg(1)->Arg(4)->Arg(16);

BENCHMARK_DEFINE_F(RoutingBenchmarkFixture, Parallel_GetValue)(benchmark::State& state) {
    for (auto _ : state) {
        Bytes out;
        auto result = parallel_->get_value(ctx_, "/v/bench", RoutingOptions{}, out);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK_REGISTER_F(RoutingBenchmarkFixture, Parallel_GetValue)->Arg(1)->Arg(4)->Arg(16);

BENCHMARK_DEFINE_F(RoutingBenchmarkFixture, Sequential_GetValue)(benchmark::State& state) {
    for (auto _ : state) {
        Bytes out;
        auto result = sequential_->get_value(ctx_, "/v/bench", RoutingOptions{}, out);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK_REGISTER_F(RoutingBenchmarkFixture, Sequential_GetValue)->Arg(1)->Arg(4)->Arg(16);

BENCHMARK_DEFINE_F(RoutingBenchmarkFixture, Parallel_FindProviders)(benchmark::State& state) {
    for (auto _ : state) {
        auto providers = parallel_->find_providers_async(ctx_, cid_, 0)->drain();
        benchmark::DoNotOptimize(providers);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0) * 8);
}
BENCHMARK_REGISTER_F(RoutingBenchmarkFixture, Parallel_FindProviders)->Arg(1)->Arg(4)->Arg(16);

static void ResultStream_Throughput(benchmark::State& state) {
    for (auto _ : state) {
        auto stream = ResultStream<int>::create(16);
        std::thread producer([stream] {
            for (int i = 0; i < 1024; ++i) {
                stream->send(i);
            }
            stream->close();
        });
        auto items = stream->drain();
        producer.join();
        benchmark::DoNotOptimize(items);
    }
    state.SetItemsProcessed(state.iterations() * 1024);
}
BENCHMARK(ResultStream_Throughput);

static void ContentId_1KB(benchmark::State& state) {
    if (!routeweave::crypto::initialize()) {
        state.SkipWithError("libsodium failed to initialize");
        return;
    }
    std::string data(1024, 'x');
    for (auto _ : state) {
        auto cid = routeweave::crypto::content_id_for(data);
        benchmark::DoNotOptimize(cid);
    }
    state.SetBytesProcessed(state.iterations() * 1024);
}
BENCHMARK(ContentId_1KB);

BENCHMARK_MAIN();
