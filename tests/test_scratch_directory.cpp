#include <catch2/catch_test_macros.hpp>
#include "sandbox/scratch_directory.hpp"
#include "test_support.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>

using namespace codeauditor;
using codeauditor::testing::TempDir;

namespace {

std::string read_file(const std::filesystem::path& p) {
    std::ifstream in(p);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

mode_t mode_of(const std::filesystem::path& p) {
    struct stat st{};
    REQUIRE(::stat(p.c_str(), &st) == 0);
    return st.st_mode & 0777;
}

} // anonymous namespace

TEST_CASE("ScratchDirectory: creates an owner-only directory named after the run", "[sandbox][scratch]") {
    TempDir root;
    std::filesystem::path created;
    {
        ScratchDirectory dir(root.path(), "abc123");
        created = dir.path();
        CHECK(std::filesystem::is_directory(created));
        CHECK(created.parent_path() == root.path());
        CHECK(created.filename().string().starts_with("run-abc123-"));
        CHECK(mode_of(created) == 0700);
    }
    CHECK_FALSE(std::filesystem::exists(created));
}

TEST_CASE("ScratchDirectory: creates a missing root", "[sandbox][scratch]") {
    TempDir root;
    const auto nested = root.path() / "a" / "b";
    ScratchDirectory dir(nested, "r1");
    CHECK(std::filesystem::is_directory(nested));
    CHECK(dir.path().parent_path() == nested);
}

TEST_CASE("ScratchDirectory: two runs with the same id get distinct directories", "[sandbox][scratch]") {
    TempDir root;
    ScratchDirectory a(root.path(), "same");
    ScratchDirectory b(root.path(), "same");
    CHECK(a.path() != b.path());
    CHECK(root.entry_count() == 2);
}

TEST_CASE("ScratchDirectory: write_file stores content with mode 0600", "[sandbox][scratch]") {
    TempDir root;
    ScratchDirectory dir(root.path(), "w");
    const auto file = dir.write_file("snippet.rs", "fn main() {}\n");

    CHECK(file == dir.path() / "snippet.rs");
    CHECK(read_file(file) == "fn main() {}\n");
    CHECK(mode_of(file) == 0600);
}

TEST_CASE("ScratchDirectory: write_file refuses to overwrite", "[sandbox][scratch]") {
    TempDir root;
    ScratchDirectory dir(root.path(), "w");
    (void)dir.write_file("snippet.rs", "first");
    CHECK_THROWS_AS(dir.write_file("snippet.rs", "second"), std::runtime_error);
    CHECK(read_file(dir.path() / "snippet.rs") == "first");
}

TEST_CASE("ScratchDirectory: write_file refuses to follow a symlink", "[sandbox][scratch]") {
    TempDir root;
    const auto outside = root.path() / "outside.txt";
    { std::ofstream(outside) << "untouched"; }

    ScratchDirectory dir(root.path(), "link");
    std::filesystem::create_symlink(outside, dir.path() / "snippet.rs");
    CHECK_THROWS_AS(dir.write_file("snippet.rs", "payload"), std::runtime_error);
    CHECK(read_file(outside) == "untouched");
}

TEST_CASE("ScratchDirectory: removes nested content on destruction", "[sandbox][scratch]") {
    TempDir root;
    {
        ScratchDirectory dir(root.path(), "tree");
        std::filesystem::create_directories(dir.path() / "target" / "debug");
        { std::ofstream(dir.path() / "target" / "debug" / "lib.rmeta") << "x"; }
        (void)dir.write_file("snippet.rs", "code");
    }
    CHECK(root.entry_count() == 0);
}

TEST_CASE("ScratchDirectory: move transfers ownership", "[sandbox][scratch]") {
    TempDir root;
    ScratchDirectory a(root.path(), "move");
    const auto p = a.path();

    ScratchDirectory b(std::move(a));
    CHECK(b.path() == p);
    CHECK(std::filesystem::exists(p));

    {
        ScratchDirectory c(root.path(), "other");
        const auto other = c.path();
        c = std::move(b);
        CHECK_FALSE(std::filesystem::exists(other));
        CHECK(std::filesystem::exists(p));
    }
    CHECK_FALSE(std::filesystem::exists(p));
}

TEST_CASE("ScratchDirectory: unusable root throws", "[sandbox][scratch]") {
    CHECK_THROWS_AS(ScratchDirectory("/proc/code-auditor-no-such-root", "x"), std::runtime_error);
}
