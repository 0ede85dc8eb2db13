/// @file batch.hpp
/// @brief Running many independent comparisons concurrently.

#pragma once

#include <jsondiff-cpp/diff.hpp>
#include <jsondiff-cpp/value.hpp>

#include <span>
#include <vector>

namespace jsondiff_cpp {

/// Two trees to compare. Both must outlive the compare_many() call.
struct ComparePair {
    const Value& left;
    const Value& right;
};

/// Compare every pair on the shared worker pool.
///
/// Each comparison runs single-threaded; only distinct pairs run
/// concurrently. Results come back in input order. An observer in
/// `options` may be invoked from several threads at once.
/// @throws OptionsError when `options` fail validation, before any work
/// is scheduled. An exception escaping one comparison is rethrown after
/// all of them finish.
auto compare_many(std::span<const ComparePair> pairs,
                  const CompareOptions& options = {}) -> std::vector<CompareResult>;

}  // namespace jsondiff_cpp
