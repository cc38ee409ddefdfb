#include <catch2/catch_test_macros.hpp>
#include "util/files.hpp"
#include <filesystem>
#include <sys/stat.h>

using namespace meshwalk::util;

TEST_CASE("File utilities", "[util][files]") {
    // Create a temporary test directory
    auto test_dir = std::filesystem::temp_directory_path() / "meshwalk_files_test";
    std::filesystem::remove_all(test_dir);

    SECTION("ensure_directory creates directories") {
        auto subdir = test_dir / "sub" / "nested";
        REQUIRE(ensure_directory(subdir));
        REQUIRE(std::filesystem::is_directory(subdir));
        REQUIRE(ensure_directory(subdir));
    }

    SECTION("atomic_write_file then read_file_string") {
        REQUIRE(ensure_directory(test_dir));
        auto file_path = test_dir / "bootstrap.json";

        REQUIRE(atomic_write_file(file_path, "{\"version\": 1}"));
        auto data = read_file_string(file_path);
        REQUIRE(data.has_value());
        REQUIRE(*data == "{\"version\": 1}");
    }

    SECTION("atomic_write_file overwrites existing file") {
        REQUIRE(ensure_directory(test_dir));
        auto file_path = test_dir / "overwrite.txt";

        REQUIRE(atomic_write_file(file_path, "first"));
        REQUIRE(atomic_write_file(file_path, "second"));
        REQUIRE(read_file_string(file_path) == std::string("second"));
        // No temporary files left behind
        size_t entries = 0;
        for (const auto& entry : std::filesystem::directory_iterator(test_dir)) {
            (void)entry;
            ++entries;
        }
        REQUIRE(entries == 1);
    }

    SECTION("Private key files are written 0600") {
        REQUIRE(ensure_directory(test_dir));
        auto file_path = test_dir / "key.pem";

        REQUIRE(atomic_write_file(file_path, "secret", 0600));
        struct stat st {};
        REQUIRE(::stat(file_path.c_str(), &st) == 0);
        REQUIRE((st.st_mode & 0777) == 0600);
    }

    SECTION("read_file_string on missing file") {
        REQUIRE_FALSE(read_file_string(test_dir / "missing").has_value());
    }

    SECTION("get_default_datadir ends in .meshwalk") {
        REQUIRE(get_default_datadir().filename() == ".meshwalk");
    }

    std::filesystem::remove_all(test_dir);
}
