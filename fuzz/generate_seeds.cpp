// Helper to generate seed corpus files for the fuzz targets.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, just a corpus generator.

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

static void write_seed(const std::string& path, std::string_view data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

int main() {
    namespace fs = std::filesystem;
    const auto paths_dir = std::string{"fuzz/corpus/path_grammar"};
    const auto compare_dir = std::string{"fuzz/corpus/compare"};
    fs::create_directories(paths_dir);
    fs::create_directories(compare_dir);

    // Path grammar: one seed per dialect
    write_seed(paths_dir + "/index.txt", "root.accounts[0].items[3].price");
    write_seed(paths_dir + "/identity.txt", "root.accounts[id=a].items[sku=x|size=9]");
    write_seed(paths_dir + "/pattern.txt", "accounts[].items[]");
    write_seed(paths_dir + "/viewer.txt", "right_root.accounts[2]");
    write_seed(paths_dir + "/quoted.txt", R"(root["a.b"][id=x\]|k=y\|z][""])");

    // Compare: two documents of equal length back to back
    write_seed(compare_dir + "/keyed.json",
               R"({"a":[{"id":1,"v":2},{"id":2,"v":3}]})"
               R"({"a":[{"id":2,"v":3},{"id":1,"v":5}]})");
    write_seed(compare_dir + "/scalars.json", "[1,2,3][3,2,1]");
    write_seed(compare_dir + "/mixed.json", R"({"x":null}{"x":[10]})");
    write_seed(compare_dir + "/awkward_keys.json",
               R"({"k]":[{"id":"a]"},{"id":1}],"":0})"
               R"({"k]":[{"id":1},{"id":"a]"}],"":1})");

    return 0;
}
