// json_interop_demo: compare two JSON documents and print the result as JSON
//
// Usage: json_interop_demo [left.json right.json]
// Without arguments two built-in documents are compared.
//
// Build: cmake --build build -DJSONDIFF_CPP_BUILD_EXAMPLES=ON
// Run:   ./build/examples/json_interop_demo before.json after.json

#include <jsondiff-cpp/json.hpp>
#include <jsondiff-cpp/jsondiff.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace jd = jsondiff_cpp;
using json = nlohmann::ordered_json;

namespace {

auto read_file(const char* path) -> std::string {
    auto in = std::ifstream{path};
    if (!in) throw jd::ValueError{std::string{"cannot open "} + path};
    auto buf = std::ostringstream{};
    buf << in.rdbuf();
    return buf.str();
}

}  // namespace

int main(int argc, char** argv) {
    auto left_text = std::string{R"({
        "accounts": [
            {"accountId": 1, "type": "roth", "balance": 100},
            {"accountId": 1, "type": "ira",  "balance": 250}
        ],
        "updatedAt": "2024-01-01"
    })"};
    auto right_text = std::string{R"({
        "accounts": [
            {"accountId": 1, "type": "ira",  "balance": 300},
            {"accountId": 1, "type": "roth", "balance": 100}
        ],
        "updatedAt": "2024-02-01"
    })"};

    try {
        if (argc == 3) {
            left_text = read_file(argv[1]);
            right_text = read_file(argv[2]);
        }

        auto result = jd::compare(jd::parse_value(left_text), jd::parse_value(right_text));

        auto ignored = std::vector<std::string>{"updatedAt"};
        result.diffs = jd::filter_ignored(result.diffs, ignored);

        json out = result;
        std::printf("%s\n", out.dump(2).c_str());
    } catch (const jd::Exception& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
        return 1;
    }
    return 0;
}
