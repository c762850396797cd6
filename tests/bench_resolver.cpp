#include <catch2/catch.hpp>
#include <sieve/resolver.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>

using namespace sieve;
namespace fs = std::filesystem;

// RAII temp tree: `width` dirs, each with `width` subdirs of `files` files
struct BenchTree {
    fs::path path;

    BenchTree(int width, int files) {
        path = fs::temp_directory_path() / ("sieve_bench_" + std::to_string(
            std::hash<std::string>{}(std::to_string(
                std::chrono::steady_clock::now().time_since_epoch().count()))));
        for (int a = 0; a < width; ++a) {
            for (int b = 0; b < width; ++b) {
                auto dir = path / ("pkg_" + std::to_string(a)) / ("mod_" + std::to_string(b));
                fs::create_directories(dir);
                for (int f = 0; f < files; ++f) {
                    std::ofstream(dir / ("file_" + std::to_string(f) + ".cs")) << f;
                    std::ofstream(dir / ("test_" + std::to_string(f) + ".cs")) << f;
                }
            }
        }
    }

    ~BenchTree() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

TEST_CASE("resolver perf: 4000-file tree with recursive exclusion < 2s", "[resolver][bench]") {
    BenchTree tree(10, 20);

    auto start = std::chrono::high_resolution_clock::now();
    auto r = resolve(std::vector<std::string>{"**/*.cs", "!**/test_*.cs"}, tree.path);
    auto end = std::chrono::high_resolution_clock::now();

    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 10 * 10 * 20);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    INFO("Resolve 4000-file tree: " << ms << " ms");
    REQUIRE(ms < 2000);
}

TEST_CASE("resolver perf: overlapping selectors descend once per directory", "[resolver][bench]") {
    BenchTree tree(10, 20);

    auto start = std::chrono::high_resolution_clock::now();
    auto r = resolve(std::vector<std::string>{
        "pkg_?/mod_?/file_*.cs", "pkg_*/mod_*/file_*.cs", "**/file_1?.cs"}, tree.path);
    auto end = std::chrono::high_resolution_clock::now();

    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 10 * 10 * 20);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    INFO("Resolve overlapping selectors: " << ms << " ms");
    REQUIRE(ms < 2000);
}
