#include <catch2/catch_test_macros.hpp>

#include "output/file_output.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

struct TmpDir {
    fs::path path;

    TmpDir() {
        path = fs::temp_directory_path() /
               ("scribe_test_file_output_" + std::to_string(getpid()));
        fs::remove_all(path);
        fs::create_directories(path);
    }

    ~TmpDir() { fs::remove_all(path); }

    size_t entries() const {
        size_t n = 0;
        for (auto it = fs::directory_iterator(path); it != fs::directory_iterator(); ++it) n++;
        return n;
    }
};

std::string read_file(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

} // namespace

TEST_CASE("FileOutput", "[output]") {
    TmpDir tmp;

    SECTION("WritesNewFile") {
        auto p = tmp.path / "out.txt";
        FileOutput out(p.string());
        REQUIRE(out.deliver("hello world").has_value());
        REQUIRE(read_file(p) == "hello world");
        REQUIRE(tmp.entries() == 1);
    }

    SECTION("EmptyTextCreatesEmptyFile") {
        auto p = tmp.path / "empty.txt";
        FileOutput out(p.string());
        REQUIRE(out.deliver("").has_value());
        REQUIRE(fs::exists(p));
        REQUIRE(fs::file_size(p) == 0);
    }

    SECTION("TruncatesExistingFile") {
        auto p = tmp.path / "out.txt";
        std::ofstream(p) << "old content that is longer";
        FileOutput out(p.string());
        REQUIRE(out.deliver("new").has_value());
        REQUIRE(read_file(p) == "new");
    }

    SECTION("Utf8PassesThrough") {
        auto p = tmp.path / "utf8.txt";
        std::string text = "Olá, 世界! \xF0\x9F\x8E\xA4\n";
        FileOutput out(p.string());
        REQUIRE(out.deliver(text).has_value());
        REQUIRE(read_file(p) == text);
    }

    SECTION("LargeText") {
        auto p = tmp.path / "big.txt";
        std::string text(4 * 1024 * 1024, 'a');
        FileOutput out(p.string());
        REQUIRE(out.deliver(text).has_value());
        REQUIRE(fs::file_size(p) == text.size());
    }

    SECTION("MissingDirectoryFails") {
        auto p = tmp.path / "nope" / "out.txt";
        FileOutput out(p.string());
        auto res = out.deliver("text");
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().find("No such file or directory") != std::string::npos);
        REQUIRE_FALSE(fs::exists(p));
        REQUIRE(tmp.entries() == 0);
    }

    SECTION("DestinationIsDirectoryLeavesNothingBehind") {
        auto p = tmp.path / "dir";
        fs::create_directories(p);
        FileOutput out(p.string());
        REQUIRE_FALSE(out.deliver("text").has_value());
        REQUIRE(fs::is_directory(p));
        REQUIRE(tmp.entries() == 1);
    }

    SECTION("SymlinkWritesThroughToTarget") {
        auto real = tmp.path / "real.txt";
        auto link = tmp.path / "link.txt";
        std::ofstream(real) << "old";
        fs::create_symlink(real, link);

        FileOutput out(link.string());
        REQUIRE(out.deliver("new text").has_value());
        REQUIRE(fs::is_symlink(link));
        REQUIRE(read_file(real) == "new text");
        REQUIRE(tmp.entries() == 2);
    }

    SECTION("DanglingSymlinkCreatesTarget") {
        auto real = tmp.path / "later.txt";
        auto link = tmp.path / "link.txt";
        fs::create_symlink(real, link);

        FileOutput out(link.string());
        REQUIRE(out.deliver("created").has_value());
        REQUIRE(fs::is_symlink(link));
        REQUIRE(read_file(real) == "created");
    }

    SECTION("LongFileName") {
        auto p = tmp.path / (std::string(250, 'a') + ".txt");
        FileOutput out(p.string());
        auto res = out.deliver("long");
        REQUIRE(res.has_value());
        REQUIRE(read_file(p) == "long");
        REQUIRE(tmp.entries() == 1);
    }

    SECTION("CharacterDeviceWrittenInPlace") {
        FileOutput out("/dev/null");
        REQUIRE(out.deliver("discarded").has_value());
        REQUIRE(fs::is_character_file("/dev/null"));
    }

    SECTION("RelativePath") {
        auto cwd = fs::current_path();
        fs::current_path(tmp.path);
        FileOutput out("rel.txt");
        auto res = out.deliver("here");
        fs::current_path(cwd);
        REQUIRE(res.has_value());
        REQUIRE(read_file(tmp.path / "rel.txt") == "here");
        REQUIRE(tmp.entries() == 1);
    }

    SECTION("EmptyPathFails") {
        FileOutput out("");
        REQUIRE_FALSE(out.deliver("text").has_value());
    }
}
