#include <jsondiff-cpp/batch.hpp>

#include <jsondiff-cpp/logging.hpp>

#include "executor.hpp"

#include <taskflow/algorithm/for_each.hpp>

#include <exception>

namespace jsondiff_cpp {

auto compare_many(std::span<const ComparePair> pairs, const CompareOptions& options)
    -> std::vector<CompareResult> {
    validate(options);
    auto results = std::vector<CompareResult>(pairs.size());
    if (pairs.empty()) return results;

    auto errors = std::vector<std::exception_ptr>(pairs.size());
    auto taskflow = tf::Taskflow{};
    taskflow.for_each_index(std::size_t{0}, pairs.size(), std::size_t{1},
        [&](std::size_t i) {
            try {
                results[i] = compare(pairs[i].left, pairs[i].right, options);
            } catch (...) {
                errors[i] = std::current_exception();
            }
        });
    detail::global_executor().run(taskflow).wait();

    for (const auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }
    logger()->debug("compare_many: {} comparisons", pairs.size());
    return results;
}

}  // namespace jsondiff_cpp
