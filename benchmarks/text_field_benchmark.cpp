// collab-text benchmarks — measures throughput of core field operations.

#include <collab-text/codec.hpp>
#include <collab-text/replica.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace collab_text;

static auto typed(std::size_t n) -> Replica {
    auto r = Replica{1};
    for (std::size_t i = 0; i < n; ++i) {
        r.splice(static_cast<std::int64_t>(i), 0, "x");
    }
    return r;
}

// =============================================================================
// Local updates
// =============================================================================

static void bm_splice_append(benchmark::State& state) {
    auto r = Replica{1};
    for (auto _ : state) {
        auto result = r.splice(static_cast<std::int64_t>(r.size()), 0, "x");
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_splice_append);

static void bm_splice_front(benchmark::State& state) {
    auto r = Replica{1};
    for (auto _ : state) {
        auto result = r.splice(0, 0, "x");
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_splice_front);

static void bm_splice_bulk(benchmark::State& state) {
    const auto chunk = std::string(static_cast<std::size_t>(state.range(0)), 'a');
    for (auto _ : state) {
        auto r = Replica{1};
        auto result = r.splice(0, 0, chunk);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(bm_splice_bulk)->Range(16, 4096);

static void bm_splice_middle_of_document(benchmark::State& state) {
    auto r = typed(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto result = r.splice(static_cast<std::int64_t>(r.size() / 2), 1, "y");
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_splice_middle_of_document)->Range(64, 8192);

// =============================================================================
// Remote patches
// =============================================================================

static void bm_apply_patches_in_order(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto source = Replica{1};
    auto patches = std::vector<Patch>{};
    for (std::size_t i = 0; i < n; ++i) {
        patches.push_back(source.splice(static_cast<std::int64_t>(i), 0, "x").patch);
    }

    for (auto _ : state) {
        auto target = Replica{2};
        for (const auto& p : patches) target.apply_patch(p);
        benchmark::DoNotOptimize(target);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_apply_patches_in_order)->Range(64, 4096);

static void bm_apply_patches_reversed(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto source = Replica{1};
    auto patches = std::vector<Patch>{};
    for (std::size_t i = 0; i < n; ++i) {
        patches.push_back(source.splice(static_cast<std::int64_t>(i), 0, "x").patch);
        if (i % 4 == 3) {
            patches.push_back(source.splice(static_cast<std::int64_t>(i - 1), 1, "").patch);
        }
    }

    for (auto _ : state) {
        auto target = Replica{2};
        for (auto it = patches.rbegin(); it != patches.rend(); ++it) target.apply_patch(*it);
        benchmark::DoNotOptimize(target);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * patches.size()));
}
BENCHMARK(bm_apply_patches_reversed)->Range(64, 4096);

// =============================================================================
// Binary codec
// =============================================================================

static void bm_encode_patch(benchmark::State& state) {
    auto r = Replica{1};
    auto patch = r.splice(0, 0, std::string(static_cast<std::size_t>(state.range(0)), 'z')).patch;
    for (auto _ : state) {
        auto bytes = encode_patch(patch);
        benchmark::DoNotOptimize(bytes);
        state.SetBytesProcessed(static_cast<std::int64_t>(bytes.size()));
    }
}
BENCHMARK(bm_encode_patch)->Range(8, 4096);

static void bm_decode_patch(benchmark::State& state) {
    auto r = Replica{1};
    auto patch = r.splice(0, 0, std::string(static_cast<std::size_t>(state.range(0)), 'z')).patch;
    const auto bytes = encode_patch(patch);
    for (auto _ : state) {
        auto decoded = decode_patch(bytes);
        benchmark::DoNotOptimize(decoded);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * bytes.size()));
}
BENCHMARK(bm_decode_patch)->Range(8, 4096);
