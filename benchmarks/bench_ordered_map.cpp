/// @file bench_ordered_map.cpp
/// @brief Performance benchmarks for ordmap.
///
/// Measured operations:
///   - Insertion (copying versions vs. rvalue builder chains)
///   - Erase at the front, middle and back
///   - Lookup (contains, get, find)
///   - Iteration (for_each, range-for, unordered())
///   - Records encode / decode

#include <ordmap/ordmap.hpp>

#include <benchmark/benchmark.h>

#include <string>
#include <vector>

using namespace ordmap;

using StringMap = OrderedMap<std::string, int>;

// ═══════════════════════════════════════════════════════════════════════════════
// Test data generators
// ═══════════════════════════════════════════════════════════════════════════════

static std::vector<std::string> generate_keys(int count) {
    std::vector<std::string> keys;
    keys.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        keys.push_back("key_" + std::to_string(i));
    }
    return keys;
}

static StringMap build_map(const std::vector<std::string>& keys) {
    StringMap m;
    int i = 0;
    for (const auto& k : keys) m = std::move(m).set(k, i++);
    return m;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Insertion
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_InsertBuilder(benchmark::State& state) {
    auto keys = generate_keys(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto m = build_map(keys);
        benchmark::DoNotOptimize(m);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_InsertBuilder)->Arg(100)->Arg(1000)->Arg(10000);

// Each set() on an lvalue copies the storage block.
static void BM_InsertVersioned(benchmark::State& state) {
    auto keys = generate_keys(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        StringMap m;
        int i = 0;
        for (const auto& k : keys) {
            StringMap next = m.set(k, i++);
            m = next;
        }
        benchmark::DoNotOptimize(m);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_InsertVersioned)->Arg(100)->Arg(1000);

// ═══════════════════════════════════════════════════════════════════════════════
// Erase
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_EraseFront(benchmark::State& state) {
    auto keys = generate_keys(static_cast<int>(state.range(0)));
    auto base = build_map(keys);
    for (auto _ : state) {
        auto m = base.erase(keys.front());
        benchmark::DoNotOptimize(m);
    }
}
BENCHMARK(BM_EraseFront)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_EraseBack(benchmark::State& state) {
    auto keys = generate_keys(static_cast<int>(state.range(0)));
    auto base = build_map(keys);
    for (auto _ : state) {
        auto m = base.erase(keys.back());
        benchmark::DoNotOptimize(m);
    }
}
BENCHMARK(BM_EraseBack)->Arg(100)->Arg(1000)->Arg(10000);

// Unique owner: erase shifts in place without copying the block.
static void BM_EraseAllInPlace(benchmark::State& state) {
    auto keys = generate_keys(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        state.PauseTiming();
        auto m = build_map(keys);
        state.ResumeTiming();
        for (size_t i = keys.size(); i-- > 0;) m = std::move(m).erase(keys[i]);
        benchmark::DoNotOptimize(m);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_EraseAllInPlace)->Arg(1000);

// ═══════════════════════════════════════════════════════════════════════════════
// Lookup
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Contains(benchmark::State& state) {
    auto keys = generate_keys(1000);
    auto m = build_map(keys);
    size_t i = 0;
    for (auto _ : state) {
        bool found = m.contains(keys[i++ % keys.size()]);
        benchmark::DoNotOptimize(found);
    }
}
BENCHMARK(BM_Contains);

static void BM_Get(benchmark::State& state) {
    auto keys = generate_keys(1000);
    auto m = build_map(keys);
    size_t i = 0;
    for (auto _ : state) {
        int v = m.get(keys[i++ % keys.size()]);
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_Get);

static void BM_GetMissing(benchmark::State& state) {
    auto m = build_map(generate_keys(1000));
    const std::string missing = "not_there";
    for (auto _ : state) {
        int v = m.get(missing);
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_GetMissing);

// ═══════════════════════════════════════════════════════════════════════════════
// Iteration
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_ForEach(benchmark::State& state) {
    auto m = build_map(generate_keys(static_cast<int>(state.range(0))));
    for (auto _ : state) {
        long sum = 0;
        m.for_each([&sum](const std::string&, int v) { sum += v; });
        benchmark::DoNotOptimize(sum);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ForEach)->Arg(1000)->Arg(10000);

static void BM_RangeFor(benchmark::State& state) {
    auto m = build_map(generate_keys(static_cast<int>(state.range(0))));
    for (auto _ : state) {
        long sum = 0;
        for (auto [k, v] : m) sum += v + static_cast<long>(k.size());
        benchmark::DoNotOptimize(sum);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_RangeFor)->Arg(1000)->Arg(10000);

static void BM_Unordered(benchmark::State& state) {
    auto m = build_map(generate_keys(static_cast<int>(state.range(0))));
    for (auto _ : state) {
        auto u = m.unordered();
        benchmark::DoNotOptimize(u);
    }
}
BENCHMARK(BM_Unordered)->Arg(1000);

// ═══════════════════════════════════════════════════════════════════════════════
// Records codec
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Encode(benchmark::State& state) {
    auto m = build_map(generate_keys(static_cast<int>(state.range(0))));
    size_t bytes = 0;
    for (auto _ : state) {
        auto s = encode(m);
        bytes = s.size();
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(bytes));
}
BENCHMARK(BM_Encode)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_EncodePretty(benchmark::State& state) {
    auto m = build_map(generate_keys(1000));
    EncodeOptions opts;
    opts.indent = 2;
    for (auto _ : state) {
        auto s = encode(m, opts);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_EncodePretty);

static void BM_Decode(benchmark::State& state) {
    auto text = encode(build_map(generate_keys(static_cast<int>(state.range(0)))));
    for (auto _ : state) {
        auto m = decode<StringMap>(text);
        benchmark::DoNotOptimize(m);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_Decode)->Arg(100)->Arg(1000)->Arg(10000);
