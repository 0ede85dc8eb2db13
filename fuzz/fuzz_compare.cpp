// Fuzz target for compare(): the input is split in two halves, each parsed
// as JSON. Any parsed document must compare equal to itself, and every
// diff path must parse back to itself and classify as an exact match on a
// side that shows it.

#include <jsondiff-cpp/json.hpp>
#include <jsondiff-cpp/jsondiff.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace jd = jsondiff_cpp;
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto half = text.size() / 2;

    try {
        auto left = jd::parse_value(text.substr(0, half));
        auto right = jd::parse_value(text.substr(half));

        if (!jd::compare(left, left).diffs.empty()) std::abort();

        auto result = jd::compare(left, right);
        auto classifier = jd::HighlightClassifier{result.diffs};
        for (const auto& d : result.diffs) {
            if (jd::IdentityPath::parse(d.path.str()) != d.path) std::abort();
            auto viewer = d.kind == jd::DiffKind::added ? jd::Viewer::right : jd::Viewer::left;
            if (classifier.classify(d.path.str(), viewer).relation != jd::Relation::exact) {
                std::abort();
            }
        }
    } catch (const jd::ValueError&) {
        // Not JSON
    }
    return 0;
}
