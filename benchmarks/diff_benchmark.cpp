// docdiff-cpp benchmarks — measures throughput of diff, apply and the version chain.

#include <docdiff-cpp/docdiff.hpp>

#include <benchmark/benchmark.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

using namespace docdiff_cpp;

// A person with `n` toys, each carrying a small nested part list.
static auto make_person(std::int64_t n, std::int64_t revision = 0) -> Value {
    auto toys = Array{};
    toys.reserve(static_cast<std::size_t>(n));
    for (std::int64_t i = 0; i < n; ++i) {
        toys.push_back(Value{Object{
            {"id", "toy" + std::to_string(i)},
            {"name", "Toy " + std::to_string(i)},
            {"price", i % 7 == 0 ? i + revision : i},
            {"parts", Value{Array{
                Value{Object{{"id", "a"}, {"kind", "wheel"}}},
                Value{Object{{"id", "b"}, {"kind", "axle"}}},
            }}},
        }});
    }
    return Value{Object{{"id", "p1"}, {"name", "Alice"}, {"toys", Value{std::move(toys)}}}};
}

// Reverse every toy order so diffing must match by identity.
static auto reversed(const Value& person) -> Value {
    auto toys = person.find("toys")->as_array();
    std::reverse(toys.begin(), toys.end());
    return person.with_field("toys", Value{std::move(toys)});
}

// =============================================================================
// Normalization
// =============================================================================

static void bm_normalize(benchmark::State& state) {
    const auto doc = make_person(state.range(0));
    for (auto _ : state) {
        auto normalized = normalize(doc);
        benchmark::DoNotOptimize(normalized);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_normalize)->Range(10, 10000);

// =============================================================================
// Diff
// =============================================================================

static void bm_diff_identical(benchmark::State& state) {
    const auto a = make_person(state.range(0));
    const auto b = make_person(state.range(0));
    for (auto _ : state) {
        auto changes = compute_diff(a, b);
        benchmark::DoNotOptimize(changes);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_diff_identical)->Range(10, 10000);

static void bm_diff_reordered(benchmark::State& state) {
    const auto a = make_person(state.range(0));
    const auto b = reversed(make_person(state.range(0), 1));
    for (auto _ : state) {
        auto changes = compute_diff(a, b);
        benchmark::DoNotOptimize(changes);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_diff_reordered)->Range(10, 10000);

static void bm_diff_with_exclusions(benchmark::State& state) {
    const auto a = make_person(state.range(0));
    const auto b = make_person(state.range(0), 1);
    const auto exclusions = ExclusionSet{"/toys/price"};
    for (auto _ : state) {
        auto changes = compute_diff(a, b, exclusions);
        benchmark::DoNotOptimize(changes);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_diff_with_exclusions)->Range(10, 10000);

// =============================================================================
// Apply
// =============================================================================

static void bm_apply_sequence(benchmark::State& state) {
    const auto a = make_person(state.range(0));
    const auto changes = compute_diff(a, make_person(state.range(0), 1));
    const auto target = reversed(a);
    for (auto _ : state) {
        auto patched = apply_change_sequence(changes, target);
        benchmark::DoNotOptimize(patched);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(changes.size()));
}
BENCHMARK(bm_apply_sequence)->Range(10, 10000);

// =============================================================================
// Version chain
// =============================================================================

static void bm_compare_versions(benchmark::State& state) {
    const auto versions = state.range(0);
    const auto base = make_person(100);
    auto diffs = std::vector<ChangeList>{};
    auto previous = base;
    for (std::int64_t v = 1; v <= versions; ++v) {
        auto next = make_person(100, v);
        diffs.push_back(compute_diff(previous, next));
        previous = std::move(next);
    }

    for (auto _ : state) {
        auto changes = compare_versions(base, diffs, 0, static_cast<std::size_t>(versions));
        benchmark::DoNotOptimize(changes);
    }
    state.SetItemsProcessed(state.iterations() * versions);
}
BENCHMARK(bm_compare_versions)->Range(1, 256);

// =============================================================================
// Record codec
// =============================================================================

static void bm_encode_record(benchmark::State& state) {
    const auto encoding = static_cast<RecordEncoding>(state.range(0));
    const auto changes = compute_diff(make_person(0), make_person(500));
    for (auto _ : state) {
        auto record = encode_changes(changes, encoding);
        benchmark::DoNotOptimize(record);
        state.SetBytesProcessed(static_cast<std::int64_t>(record.size()));
    }
    state.SetLabel(std::string{to_string_view(encoding)});
}
BENCHMARK(bm_encode_record)->Arg(0)->Arg(1)->Arg(2);

static void bm_decode_record(benchmark::State& state) {
    const auto encoding = static_cast<RecordEncoding>(state.range(0));
    const auto record = encode_changes(compute_diff(make_person(0), make_person(500)), encoding);
    for (auto _ : state) {
        auto changes = decode_changes(record);
        benchmark::DoNotOptimize(changes);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(record.size()));
    state.SetLabel(std::string{to_string_view(encoding)});
}
BENCHMARK(bm_decode_record)->Arg(0)->Arg(1)->Arg(2);
