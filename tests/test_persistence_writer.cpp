#include <catch2/catch_test_macros.hpp>

#include "storage/persistence_writer.hpp"

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
               ("meetcap_test_writer_" + std::to_string(getpid()) + "_" + std::to_string(counter()++));
        fs::create_directories(path);
    }
    ~TmpDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    static int& counter() {
        static int n = 0;
        return n;
    }
};

std::string slurp(const fs::path& p) {
    std::ifstream f(p);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

} // namespace

TEST_CASE("PersistenceWriter", "[persistence]") {
    TmpDir dir;
    PersistenceWriter writer;

    SECTION("WriteCreatesParentDirectories") {
        auto target = dir.path / "a" / "b" / "doc.json";
        writer.write(target, "{\"x\":1}");
        writer.flush();
        REQUIRE(slurp(target) == "{\"x\":1}");
    }

    SECTION("LastWriteWins") {
        auto target = dir.path / "index.json";
        for (int i = 0; i < 100; ++i) {
            writer.write(target, std::to_string(i));
        }
        writer.flush();
        REQUIRE(slurp(target) == "99");
    }

    SECTION("NoTempFilesLeftBehind") {
        writer.write(dir.path / "one.json", "1");
        writer.write(dir.path / "two.json", "2");
        writer.flush();

        int files = 0;
        for (auto& e : fs::directory_iterator(dir.path)) {
            REQUIRE(e.path().string().find(".tmp.") == std::string::npos);
            ++files;
        }
        REQUIRE(files == 2);
    }

    SECTION("RemoveAfterWrite") {
        auto target = dir.path / "gone.json";
        writer.write(target, "x");
        writer.remove(target);
        writer.flush();
        REQUIRE_FALSE(fs::exists(target));
        REQUIRE(writer.failures() == 0);
    }

    SECTION("RemoveAllThenWrite") {
        writer.write(dir.path / "items" / "a.json", "a");
        writer.remove_all(dir.path / "items");
        writer.write(dir.path / "items" / "b.json", "b");
        writer.flush();
        REQUIRE_FALSE(fs::exists(dir.path / "items" / "a.json"));
        REQUIRE(slurp(dir.path / "items" / "b.json") == "b");
    }

    SECTION("FailureIsCountedNotThrown") {
        auto blocker = dir.path / "file";
        { std::ofstream(blocker) << "not a directory"; }

        writer.write(blocker / "child.json", "x");
        writer.write(dir.path / "after.json", "ok");
        writer.flush();

        REQUIRE(writer.failures() == 1);
        REQUIRE(slurp(dir.path / "after.json") == "ok");
    }
}

TEST_CASE("PersistenceWriter destructor drains the queue", "[persistence]") {
    TmpDir dir;
    {
        PersistenceWriter writer;
        for (int i = 0; i < 20; ++i) {
            writer.write(dir.path / ("f" + std::to_string(i) + ".json"), "x");
        }
    }
    for (int i = 0; i < 20; ++i) {
        REQUIRE(fs::exists(dir.path / ("f" + std::to_string(i) + ".json")));
    }
}
