/// @file test_io.cpp
/// @brief Tests for relic_asset byte sources

#include <catch2/catch.hpp>
#include <relic/asset/io.hpp>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using namespace relic_asset;

namespace {

/// Scratch directory removed on scope exit
struct TempDir {
    std::filesystem::path path;

    explicit TempDir(const std::string& name)
        : path(std::filesystem::temp_directory_path() / ("relic_test_" + name))
    {
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

void write_file(const std::filesystem::path& path, const std::string& text) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << text;
}

} // anonymous namespace

// =============================================================================
// MemoryAssetIo Tests
// =============================================================================

TEST_CASE("MemoryAssetIo: read and write", "[asset][io]") {
    MemoryAssetIo io;
    io.insert_text("docs/readme.txt", "hello");

    auto bytes = io.read("docs/readme.txt");
    REQUIRE(bytes);
    REQUIRE(to_string(bytes.value()) == "hello");
    REQUIRE(io.read_count("docs/readme.txt") == 1);
    REQUIRE(io.total_reads() == 1);

    auto missing = io.read("docs/missing.txt");
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().asset_kind() == AssetError::Kind::IoError);
    REQUIRE(io.total_reads() == 2);

    REQUIRE(io.write("out/data.bin", to_bytes("abc")));
    REQUIRE(io.text("out/data.bin") == std::optional<std::string>("abc"));
}

TEST_CASE("MemoryAssetIo: paths are normalized", "[asset][io]") {
    MemoryAssetIo io;
    io.insert_text("./a/../b.txt", "x");
    REQUIRE(io.exists("b.txt"));
    REQUIRE(io.read("b.txt"));
    REQUIRE(io.read_count("./b.txt") == 1);
}

TEST_CASE("MemoryAssetIo: directories", "[asset][io]") {
    MemoryAssetIo io;
    io.insert_text("levels/one.txt", "1");
    io.insert_text("levels/two.txt", "2");
    io.insert_text("levels/extra/three.txt", "3");
    io.insert_text("other.txt", "x");

    REQUIRE(io.is_directory("levels"));
    REQUIRE(io.is_directory("levels/extra"));
    REQUIRE_FALSE(io.is_directory("levels/one.txt"));
    REQUIRE(io.exists("levels"));

    auto entries = io.read_directory("levels");
    REQUIRE(entries);
    REQUIRE(entries.value() == std::vector<std::string>{
        "levels/extra", "levels/one.txt", "levels/two.txt"});

    REQUIRE(io.read_directory("nowhere").is_err());
}

TEST_CASE("MemoryAssetIo: rename and remove", "[asset][io]") {
    MemoryAssetIo io;
    io.insert_text("a.tmp", "data");

    REQUIRE(io.rename("a.tmp", "a.txt"));
    REQUIRE_FALSE(io.exists("a.tmp"));
    REQUIRE(io.text("a.txt") == std::optional<std::string>("data"));

    REQUIRE(io.remove("a.txt"));
    REQUIRE(io.remove("a.txt").is_err());
    REQUIRE(io.file_count() == 0);
}

TEST_CASE("MemoryAssetIo: failure injection", "[asset][io]") {
    MemoryAssetIo io;
    io.insert_text("a.txt", "old");

    io.set_fail_writes(true);
    REQUIRE(io.write("a.txt", to_bytes("new")).is_err());
    REQUIRE(io.text("a.txt") == std::optional<std::string>("old"));
    io.set_fail_writes(false);

    io.set_fail_renames(true);
    REQUIRE(io.write("b.tmp", to_bytes("x")));
    REQUIRE(io.rename("b.tmp", "b.txt").is_err());
}

TEST_CASE("MemoryAssetIo: change notifications", "[asset][io]") {
    MemoryAssetIo io;
    io.insert_text("before.txt", "x");
    REQUIRE(io.poll_changes().empty());

    io.watch_for_changes();
    io.insert_text("a.txt", "1");
    io.insert_text("a.txt", "2");
    io.insert_text("a.txt.meta", "{}");
    REQUIRE(io.write("b.txt.tmp", to_bytes("x")));

    auto changes = io.poll_changes();
    REQUIRE(changes == std::vector<std::string>{"a.txt"});
    REQUIRE(io.poll_changes().empty());
}

// =============================================================================
// FileAssetIo Tests
// =============================================================================

TEST_CASE("FileAssetIo: read and write", "[asset][io]") {
    TempDir dir("file_io_rw");
    FileAssetIo io(dir.path);

    REQUIRE(io.write("nested/data.txt", to_bytes("payload")));
    REQUIRE(io.exists("nested/data.txt"));
    REQUIRE(io.is_directory("nested"));

    auto bytes = io.read("nested/data.txt");
    REQUIRE(bytes);
    REQUIRE(to_string(bytes.value()) == "payload");

    REQUIRE(io.read("nested/missing.txt").error().asset_kind() == AssetError::Kind::IoError);
}

TEST_CASE("FileAssetIo: rename replaces target", "[asset][io]") {
    TempDir dir("file_io_rename");
    FileAssetIo io(dir.path);

    REQUIRE(io.write("a.meta", to_bytes("old")));
    REQUIRE(io.write("a.meta.tmp", to_bytes("new")));
    REQUIRE(io.rename("a.meta.tmp", "a.meta"));

    REQUIRE(to_string(io.read("a.meta").value()) == "new");
    REQUIRE_FALSE(io.exists("a.meta.tmp"));
    REQUIRE(io.remove("a.meta"));
    REQUIRE(io.remove("a.meta").is_err());
}

TEST_CASE("FileAssetIo: read_directory returns relative sorted paths", "[asset][io]") {
    TempDir dir("file_io_dir");
    write_file(dir.path / "b.txt", "b");
    write_file(dir.path / "a.txt", "a");
    write_file(dir.path / "sub" / "c.txt", "c");

    FileAssetIo io(dir.path);
    auto entries = io.read_directory("");
    REQUIRE(entries);
    REQUIRE(entries.value() == std::vector<std::string>{"a.txt", "b.txt", "sub"});

    auto sub = io.read_directory("sub");
    REQUIRE(sub.value() == std::vector<std::string>{"sub/c.txt"});
}

TEST_CASE("FileAssetIo: polling detects new, modified and deleted files", "[asset][io]") {
    TempDir dir("file_io_watch");
    write_file(dir.path / "existing.txt", "v1");
    write_file(dir.path / "doomed.txt", "x");

    FileAssetIo io(dir.path);
    REQUIRE(io.poll_changes().empty());  // not watching yet

    io.watch_for_changes();
    REQUIRE(io.poll_changes().empty());

    write_file(dir.path / "fresh.txt", "new");
    write_file(dir.path / "fresh.txt.meta", "{}");
    std::filesystem::remove(dir.path / "doomed.txt");

    auto changes = io.poll_changes();
    REQUIRE(std::find(changes.begin(), changes.end(), "fresh.txt") != changes.end());
    REQUIRE(std::find(changes.begin(), changes.end(), "doomed.txt") != changes.end());
    REQUIRE(std::find(changes.begin(), changes.end(), "fresh.txt.meta") == changes.end());

    // Modification times need to move forward
    auto later = std::filesystem::last_write_time(dir.path / "existing.txt") + std::chrono::seconds(2);
    std::filesystem::last_write_time(dir.path / "existing.txt", later);
    changes = io.poll_changes();
    REQUIRE(changes == std::vector<std::string>{"existing.txt"});
}

TEST_CASE("FileModificationTracker", "[asset][io]") {
    TempDir dir("tracker");
    auto file = dir.path / "tracked.txt";
    write_file(file, "x");

    FileModificationTracker tracker;
    REQUIRE(tracker.is_modified(file));
    REQUIRE(tracker.update(file));
    REQUIRE_FALSE(tracker.update(file));
    REQUIRE_FALSE(tracker.is_modified(file));
    REQUIRE(tracker.size() == 1);

    tracker.remove(file);
    REQUIRE(tracker.tracked().empty());
    REQUIRE_FALSE(tracker.update(dir.path / "missing.txt"));
}
