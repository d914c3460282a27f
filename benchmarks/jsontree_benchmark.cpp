// jsontree-cpp benchmarks - measures throughput of diff, patch generation
// and patch application on synthetic documents.

#include <jsontree-cpp/jsontree.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace jsontree_cpp;

// A list of n user records, each a small nested object.
static auto make_users(std::size_t n, int salt) -> Value {
    auto users = Array{};
    users.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        auto address = Object{};
        address.set("city", "City " + std::to_string(i % 17));
        address.set("zip", static_cast<double>(10000 + i));

        auto user = Object{};
        user.set("id", static_cast<double>(i));
        user.set("name", "user" + std::to_string(i));
        user.set("active", (i + static_cast<std::size_t>(salt)) % 3 != 0);
        user.set("score", static_cast<double>((i * 7 + static_cast<std::size_t>(salt)) % 100));
        user.set("address", std::move(address));
        users.push_back(std::move(user));
    }
    auto doc = Object{};
    doc.set("users", std::move(users));
    return doc;
}

// =============================================================================
// Diff
// =============================================================================

static void bm_diff_identical(benchmark::State& state) {
    const auto doc = make_users(static_cast<std::size_t>(state.range(0)), 0);
    for (auto _ : state) {
        auto records = diff(doc, doc);
        benchmark::DoNotOptimize(records);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_diff_identical)->Range(10, 1000);

static void bm_diff_changed(benchmark::State& state) {
    const auto before = make_users(static_cast<std::size_t>(state.range(0)), 0);
    const auto after = make_users(static_cast<std::size_t>(state.range(0)), 1);
    for (auto _ : state) {
        auto records = diff(before, after);
        benchmark::DoNotOptimize(records);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_diff_changed)->Range(10, 1000);

static void bm_diff_ignore_order(benchmark::State& state) {
    auto items = Array{};
    auto reversed = Array{};
    for (std::int64_t i = 0; i < state.range(0); ++i) items.push_back(static_cast<double>(i));
    reversed.assign(items.rbegin(), items.rend());
    const auto before = Value{std::move(items)};
    const auto after = Value{std::move(reversed)};
    const auto options = DiffOptions{.ignore_order = true};
    for (auto _ : state) {
        auto records = diff(before, after, options);
        benchmark::DoNotOptimize(records);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_diff_ignore_order)->Range(10, 1000);

// =============================================================================
// Patch
// =============================================================================

static void bm_generate_patch(benchmark::State& state) {
    const auto records = diff(make_users(static_cast<std::size_t>(state.range(0)), 0),
                              make_users(static_cast<std::size_t>(state.range(0)), 1));
    for (auto _ : state) {
        auto ops = generate_patch(records);
        benchmark::DoNotOptimize(ops);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(records.size()));
}
BENCHMARK(bm_generate_patch)->Range(10, 1000);

static void bm_apply_patch(benchmark::State& state) {
    const auto before = make_users(static_cast<std::size_t>(state.range(0)), 0);
    const auto ops = generate_patch(
        diff(before, make_users(static_cast<std::size_t>(state.range(0)), 1)));
    for (auto _ : state) {
        auto result = apply_patch(before, ops);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(ops.size()));
}
BENCHMARK(bm_apply_patch)->Range(10, 1000);

static void bm_pointer_get(benchmark::State& state) {
    const auto doc = make_users(1000, 0);
    const auto pointer = Pointer::parse("/users/999/address/city");
    for (auto _ : state) {
        const auto* node = &get(doc, pointer);
        benchmark::DoNotOptimize(node);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_pointer_get);

// =============================================================================
// JSON text
// =============================================================================

static void bm_parse_dump(benchmark::State& state) {
    const auto text = dump(make_users(static_cast<std::size_t>(state.range(0)), 0));
    for (auto _ : state) {
        auto out = dump(parse(text));
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(text.size()));
}
BENCHMARK(bm_parse_dump)->Range(10, 1000);
