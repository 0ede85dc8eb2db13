// basic_usage: compare two trees, then highlight nodes of each side
//
// Builds two payloads in code, compares them, and walks both trees
// printing how every node relates to the diff set.
//
// Build: cmake --build build -DJSONDIFF_CPP_BUILD_EXAMPLES=ON
// Run:   ./build/examples/basic_usage

#include <jsondiff-cpp/jsondiff.hpp>

#include <cstdio>
#include <string>

namespace jd = jsondiff_cpp;

namespace {

void print_tree(const jd::Value& node, const std::string& path, jd::Viewer viewer,
                const jd::HighlightClassifier& classifier, const jd::ConversionContext& ctx) {
    auto c = classifier.classify(path, viewer, ctx);
    if (c.relation != jd::Relation::none) {
        std::printf("  %-40s %s%s%s\n", path.c_str(),
                    std::string{jd::to_string_view(c.relation)}.c_str(),
                    c.kind ? " " : "",
                    c.kind ? std::string{jd::to_string_view(*c.kind)}.c_str() : "");
    }
    if (const auto* arr = jd::as_array(node)) {
        for (std::size_t i = 0; i < arr->size(); ++i) {
            print_tree((*arr)[i], path + "[" + std::to_string(i) + "]", viewer, classifier, ctx);
        }
    } else if (const auto* obj = jd::as_object(node)) {
        for (const auto& [key, child] : *obj) {
            print_tree(child, path + "." + key, viewer, classifier, ctx);
        }
    }
}

}  // namespace

int main() {
    auto left = jd::Value{jd::Object{
        {"owner", "Alice"},
        {"contributions", jd::Array{
            jd::Object{{"id", "a"}, {"amt", 7000}},
            jd::Object{{"id", "b"}, {"amt", 1000}},
        }},
    }};
    auto right = jd::Value{jd::Object{
        {"owner", "Alice"},
        {"contributions", jd::Array{
            jd::Object{{"id", "b"}, {"amt", 1000}},
            jd::Object{{"id", "a"}, {"amt", 3500}},
            jd::Object{{"id", "c"}, {"amt", 250}},
        }},
    }};

    // -- Compare -------------------------------------------------------------
    auto result = jd::compare(left, right);

    std::printf("Diffs (%zu):\n", result.diffs.size());
    for (const auto& d : result.diffs) {
        std::printf("  %-8s %s\n", std::string{jd::to_string_view(d.kind)}.c_str(),
                    d.path.str().c_str());
    }

    std::printf("Identity keys:\n");
    for (const auto& info : result.identity_keys) {
        std::printf("  %s -> %s\n", info.array_pattern.str().c_str(), info.identity_key.c_str());
    }

    auto s = jd::summarize(result.diffs);
    std::printf("Summary: %zu added, %zu removed, %zu changed\n", s.added, s.removed, s.changed);

    // -- Highlight both sides --------------------------------------------------
    auto classifier = jd::HighlightClassifier{result.diffs};

    std::printf("Left:\n");
    print_tree(left, "left_root", jd::Viewer::left, classifier,
               jd::ConversionContext{left, result.identity_keys});
    std::printf("Right:\n");
    print_tree(right, "right_root", jd::Viewer::right, classifier,
               jd::ConversionContext{right, result.identity_keys});

    // -- Convert between dialects ------------------------------------------------
    auto ctx = jd::ConversionContext{right, result.identity_keys};
    auto identity = jd::IdentityPath::parse("root.contributions[id=a].amt");
    if (auto index = jd::identity_to_index(identity, ctx)) {
        std::printf("%s is %s on the right\n", identity.str().c_str(), index->str().c_str());
    }

    return 0;
}
