#include <catch2/catch_test_macros.hpp>

#include "temp_audio.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
}

} // namespace

TEST_CASE("TempAudioFile", "[staging]") {
    std::string payload("\x1a\x45\xdf\xa3webm-bytes\0tail", 19);

    SECTION("WritesUploadWithSuffix") {
        std::istringstream upload(payload);
        auto file = TempAudioFile::create(upload);
        REQUIRE(file.has_value());
        REQUIRE(fs::path(file->path()).extension() == ".webm");
        REQUIRE(read_file(file->path()) == payload);
    }

    SECTION("RemovedOnDestruction") {
        std::string path;
        {
            std::istringstream upload(payload);
            auto file = TempAudioFile::create(upload, ".wav");
            REQUIRE(file.has_value());
            path = file->path();
            REQUIRE(fs::exists(path));
        }
        REQUIRE_FALSE(fs::exists(path));
    }

    SECTION("UniqueNames") {
        std::istringstream a(payload), b(payload);
        auto first = TempAudioFile::create(a);
        auto second = TempAudioFile::create(b);
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        REQUIRE(first->path() != second->path());
    }

    SECTION("AlreadyRemovedIsTolerated") {
        std::string path;
        {
            std::istringstream upload(payload);
            auto file = TempAudioFile::create(upload);
            REQUIRE(file.has_value());
            path = file->path();
            fs::remove(path);
        }
        REQUIRE_FALSE(fs::exists(path));
    }

    SECTION("MoveTransfersOwnership") {
        std::istringstream upload(payload);
        auto file = TempAudioFile::create(upload);
        REQUIRE(file.has_value());
        std::string path = file->path();

        TempAudioFile moved = std::move(*file);
        REQUIRE(moved.path() == path);
        REQUIRE(fs::exists(path));
    }

    SECTION("EmptyUpload") {
        std::istringstream upload("");
        auto file = TempAudioFile::create(upload);
        REQUIRE(file.has_value());
        REQUIRE(fs::file_size(file->path()) == 0);
    }

    SECTION("MissingDirectoryFails") {
        std::istringstream upload(payload);
        auto file = TempAudioFile::create(upload, ".webm", "/nonexistent/stt_test_dir");
        REQUIRE_FALSE(file.has_value());
    }
}
