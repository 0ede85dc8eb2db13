// jsondiff-cpp benchmarks: measures throughput of core operations.

#include <jsondiff-cpp/jsondiff.hpp>
#include <jsondiff-cpp/json.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace jsondiff_cpp;

// Payload with `rows` keyed elements; `shuffled` reverses their order and
// changes every tenth amount.
static auto make_payload(std::int64_t rows, bool shuffled) -> Value {
    auto items = Array{};
    items.reserve(static_cast<std::size_t>(rows));
    for (std::int64_t i = 0; i < rows; ++i) {
        auto id = shuffled ? rows - 1 - i : i;
        auto amount = std::int64_t{id * 10};
        if (shuffled && id % 10 == 0) amount += 1;
        items.emplace_back(Object{
            {"id", "row-" + std::to_string(id)},
            {"amount", amount},
            {"notes", Array{"a", "b", "c"}},
        });
    }
    return Value{Object{{"items", std::move(items)}}};
}

static auto make_positional(std::int64_t size, int offset) -> Value {
    auto items = Array{};
    items.reserve(static_cast<std::size_t>(size));
    for (std::int64_t i = 0; i < size; ++i) items.emplace_back((i + offset) % 7);
    return Value{std::move(items)};
}

// =============================================================================
// Path grammar
// =============================================================================

static void bm_parse_identity_path(benchmark::State& state) {
    for (auto _ : state) {
        auto p = IdentityPath::parse("root.accounts[id=a].holdings[symbol=X|lot=3].amount");
        benchmark::DoNotOptimize(p);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_parse_identity_path);

static void bm_is_strict_ancestor(benchmark::State& state) {
    for (auto _ : state) {
        auto r = is_strict_ancestor("accounts[id=a]", "accounts[id=a].holdings[0].amount");
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_is_strict_ancestor);

// =============================================================================
// Compare
// =============================================================================

static void bm_compare_keyed(benchmark::State& state) {
    const auto left = make_payload(state.range(0), false);
    const auto right = make_payload(state.range(0), true);
    for (auto _ : state) {
        auto result = compare(left, right);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_compare_keyed)->Range(10, 10000);

static void bm_compare_positional(benchmark::State& state) {
    const auto left = make_positional(state.range(0), 0);
    const auto right = make_positional(state.range(0), 1);
    for (auto _ : state) {
        auto result = compare(left, right);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_compare_positional)->Range(10, 10000);

static void bm_compare_identical(benchmark::State& state) {
    const auto left = make_payload(1000, false);
    const auto right = left;
    for (auto _ : state) {
        auto result = compare(left, right);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_compare_identical);

// =============================================================================
// Batch: sequential loop vs compare_many
// =============================================================================

static void bm_compare_batch(benchmark::State& state) {
    const auto parallel = state.range(0) != 0;
    constexpr auto pair_count = 64;

    auto lefts = std::vector<Value>{};
    auto rights = std::vector<Value>{};
    for (int i = 0; i < pair_count; ++i) {
        lefts.push_back(make_payload(200, false));
        rights.push_back(make_payload(200, true));
    }
    auto pairs = std::vector<ComparePair>{};
    for (std::size_t i = 0; i < lefts.size(); ++i) pairs.push_back({lefts[i], rights[i]});

    for (auto _ : state) {
        if (parallel) {
            auto results = compare_many(pairs);
            benchmark::DoNotOptimize(results);
        } else {
            auto results = std::vector<CompareResult>{};
            results.reserve(pairs.size());
            for (const auto& p : pairs) results.push_back(compare(p.left, p.right));
            benchmark::DoNotOptimize(results);
        }
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * pair_count);
    state.SetLabel(parallel ? "parallel" : "sequential");
}
BENCHMARK(bm_compare_batch)->Arg(0)->Arg(1);

// =============================================================================
// Highlighting
// =============================================================================

static void bm_classify_every_node(benchmark::State& state) {
    const auto rows = state.range(0);
    const auto left = make_payload(rows, false);
    const auto right = make_payload(rows, true);
    const auto result = compare(left, right);
    const auto classifier = HighlightClassifier{result.diffs};
    const auto ctx = ConversionContext{right, result.identity_keys};

    auto queries = std::vector<std::string>{};
    for (std::int64_t i = 0; i < rows; ++i) {
        queries.push_back("right_root.items[" + std::to_string(i) + "].amount");
    }

    for (auto _ : state) {
        for (const auto& q : queries) {
            auto c = classifier.classify(q, Viewer::right, ctx);
            benchmark::DoNotOptimize(c);
        }
    }
    state.SetItemsProcessed(state.iterations() * rows);
}
BENCHMARK(bm_classify_every_node)->Range(10, 1000);

// =============================================================================
// JSON interop
// =============================================================================

static void bm_parse_value(benchmark::State& state) {
    auto text = nlohmann::ordered_json(make_payload(1000, false)).dump();
    for (auto _ : state) {
        auto v = parse_value(text);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(text.size()));
}
BENCHMARK(bm_parse_value);
