// Fuzz target for the path grammar: arbitrary text must either parse or
// raise PathError, and whatever parses must print back to a path that
// parses to the same segments.

#include <jsondiff-cpp/error.hpp>
#include <jsondiff-cpp/path.hpp>
#include <jsondiff-cpp/path_grammar.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    try {
        auto parsed = jsondiff_cpp::parse_path(text);
        auto printed = jsondiff_cpp::to_string(parsed);
        if (jsondiff_cpp::parse_path(printed) != parsed) std::abort();

        auto dialect = jsondiff_cpp::detect_dialect(text);
        (void)dialect;
        auto core = jsondiff_cpp::strip_prefixes(text);
        (void)jsondiff_cpp::segment_count(core);
    } catch (const jsondiff_cpp::PathError&) {
        // Rejected input
    }
    return 0;
}
