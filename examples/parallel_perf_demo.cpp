// parallel_perf_demo: sequential compare() against compare_many()
//
// Generates many independent payload pairs and compares them once in a
// loop and once on the shared Taskflow executor, checking that both
// produce the same results.
//
// Build: cmake --build build -DCMAKE_BUILD_TYPE=Release -DJSONDIFF_CPP_BUILD_EXAMPLES=ON
// Run:   ./build/examples/parallel_perf_demo

#include <jsondiff-cpp/jsondiff.hpp>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace jd = jsondiff_cpp;

struct Timer {
    std::chrono::steady_clock::time_point start =
        std::chrono::steady_clock::now();
    auto ms() const -> double {
        return std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
    }
};

static auto make_payload(int seed, int rows, bool mutate) -> jd::Value {
    auto items = jd::Array{};
    items.reserve(static_cast<std::size_t>(rows));
    for (int i = 0; i < rows; ++i) {
        // Reverse the order on the mutated side so correlation is by key.
        auto id = mutate ? rows - 1 - i : i;
        auto amount = std::int64_t{seed * 1000 + id};
        if (mutate && id % 17 == 0) amount += 1;
        items.emplace_back(jd::Object{
            {"id", "row-" + std::to_string(id)},
            {"amount", amount},
            {"tags", jd::Array{"x", "y"}},
        });
    }
    return jd::Value{jd::Object{{"seed", seed}, {"items", std::move(items)}}};
}

int main() {
    constexpr int pairs_count = 256;
    constexpr int rows = 400;

    auto lefts = std::vector<jd::Value>{};
    auto rights = std::vector<jd::Value>{};
    for (int i = 0; i < pairs_count; ++i) {
        lefts.push_back(make_payload(i, rows, false));
        rights.push_back(make_payload(i, rows, true));
    }
    auto pairs = std::vector<jd::ComparePair>{};
    for (std::size_t i = 0; i < lefts.size(); ++i) pairs.push_back({lefts[i], rights[i]});

    auto sequential = std::vector<jd::CompareResult>{};
    auto t1 = Timer{};
    for (const auto& p : pairs) sequential.push_back(jd::compare(p.left, p.right));
    auto sequential_ms = t1.ms();

    auto t2 = Timer{};
    auto parallel = jd::compare_many(pairs);
    auto parallel_ms = t2.ms();

    auto total = std::size_t{0};
    for (const auto& r : parallel) total += r.diffs.size();

    std::printf("%d pairs x %d rows, %zu diffs\n", pairs_count, rows, total);
    std::printf("  sequential:   %8.1f ms\n", sequential_ms);
    std::printf("  compare_many: %8.1f ms\n", parallel_ms);
    std::printf("  identical:    %s\n", sequential == parallel ? "yes" : "no");
    return sequential == parallel ? 0 : 1;
}
