/// @file jsondiff.hpp
/// @brief Umbrella header for the jsondiff-cpp library.
///
/// Include this single header for access to all public types:
/// Value, the path dialects, compare(), the path converter, the highlight
/// classifier, compare_many() and the error types. JSON interop lives in
/// json.hpp.

#pragma once

#include <jsondiff-cpp/batch.hpp>
#include <jsondiff-cpp/diff.hpp>
#include <jsondiff-cpp/error.hpp>
#include <jsondiff-cpp/highlight.hpp>
#include <jsondiff-cpp/identity_key.hpp>
#include <jsondiff-cpp/logging.hpp>
#include <jsondiff-cpp/path.hpp>
#include <jsondiff-cpp/path_converter.hpp>
#include <jsondiff-cpp/path_grammar.hpp>
#include <jsondiff-cpp/value.hpp>
