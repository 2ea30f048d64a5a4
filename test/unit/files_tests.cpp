#include <catch2/catch.hpp>
#include "util/files.hpp"
#include <filesystem>
#include <fstream>
#include <sys/stat.h>

using namespace offsync::util;

TEST_CASE("File utilities", "[files]") {
    // Create a temporary test directory
    auto test_dir = std::filesystem::temp_directory_path() / "offsync_files_test";
    std::filesystem::remove_all(test_dir);

    SECTION("ensure_directory creates directories") {
        auto subdir = test_dir / "sub" / "nested";
        REQUIRE(ensure_directory(subdir));
        REQUIRE(std::filesystem::exists(subdir));
        REQUIRE(std::filesystem::is_directory(subdir));
    }

    SECTION("ensure_directory on existing directory") {
        REQUIRE(ensure_directory(test_dir));
        REQUIRE(ensure_directory(test_dir));
    }

    SECTION("atomic_write_file creates file and parent") {
        auto file_path = test_dir / "deep" / "test.json";
        REQUIRE(atomic_write_file(file_path, "{}"));
        REQUIRE(std::filesystem::exists(file_path));
    }

    SECTION("read_file_string retrieves written data") {
        auto file_path = test_dir / "test2.json";
        std::string text = R"({"version":1,"jobs":[]})";
        REQUIRE(atomic_write_file(file_path, text));

        auto result = read_file_string(file_path);
        REQUIRE(result.has_value());
        REQUIRE(*result == text);
    }

    SECTION("atomic_write_file overwrites existing file") {
        auto file_path = test_dir / "test3.json";
        REQUIRE(atomic_write_file(file_path, "first version, longer"));
        REQUIRE(atomic_write_file(file_path, "second"));

        auto result = read_file_string(file_path);
        REQUIRE(result == std::string("second"));
    }

    SECTION("atomic_write_file leaves no temp files behind") {
        auto file_path = test_dir / "test4.json";
        REQUIRE(atomic_write_file(file_path, "data"));

        size_t count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(test_dir)) {
            (void)entry;
            count++;
        }
        REQUIRE(count == 1);
    }

    SECTION("atomic_write_file applies mode") {
        auto file_path = test_dir / "secret.json";
        REQUIRE(atomic_write_file(file_path, "token", 0600));

        struct stat st{};
        REQUIRE(stat(file_path.c_str(), &st) == 0);
        CHECK((st.st_mode & 0777) == 0600);
    }

    SECTION("read_file_string returns nullopt on non-existent file") {
        auto result = read_file_string(test_dir / "nonexistent.json");
        REQUIRE_FALSE(result.has_value());
    }

    SECTION("read_file_string handles empty file") {
        ensure_directory(test_dir);
        auto file_path = test_dir / "empty.json";
        { std::ofstream out(file_path); }
        auto result = read_file_string(file_path);
        REQUIRE(result.has_value());
        REQUIRE(result->empty());
    }

    SECTION("quarantine_file moves file aside") {
        auto file_path = test_dir / "offline_queue.json";
        REQUIRE(atomic_write_file(file_path, "not json"));

        auto moved = quarantine_file(file_path);
        REQUIRE(moved.has_value());
        REQUIRE_FALSE(std::filesystem::exists(file_path));
        REQUIRE(std::filesystem::exists(*moved));
        REQUIRE(moved->filename().string().find("offline_queue.json.corrupt.") == 0);
        REQUIRE(read_file_string(*moved) == std::string("not json"));
    }

    SECTION("quarantine_file on missing file") {
        REQUIRE_FALSE(quarantine_file(test_dir / "missing.json").has_value());
    }

    SECTION("get_default_datadir returns valid path") {
        auto datadir = get_default_datadir();
        REQUIRE(!datadir.empty());
        REQUIRE(datadir.filename().string() == ".offsync");
    }

    // Cleanup
    std::filesystem::remove_all(test_dir);
}
