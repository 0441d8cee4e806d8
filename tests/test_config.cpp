#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

using Catch::Matchers::WithinAbs;

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "meetcap_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        ::write(fd, content.data(), content.size());
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.backend.type == "lan");
        REQUIRE(cfg.backend.url == "http://localhost:8080");
        REQUIRE(cfg.backend.api_format == "whisper.cpp");
        REQUIRE(cfg.backend.language == "en");
        REQUIRE(cfg.backend.timeout_s == 0);
        REQUIRE(cfg.diarization.url == "http://localhost:8090");
        REQUIRE_THAT(cfg.diarization.threshold, WithinAbs(0.5, 1e-6));
        REQUIRE_THAT(cfg.diarization.min_duration, WithinAbs(0.25, 1e-6));
        REQUIRE_THAT(cfg.diarization.merge_gap, WithinAbs(0.35, 1e-6));
        REQUIRE(cfg.audio.buffer_seconds == 10);
        REQUIRE(cfg.storage.meetings_dir.empty());
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "backend": {
                "type": "lan",
                "url": "http://10.0.0.1:9090",
                "api_format": "parakeet",
                "language": "de",
                "timeout_s": 300
            },
            "diarization": {
                "url": "http://10.0.0.2:8090",
                "threshold": 0.6,
                "min_duration": 0.5,
                "merge_gap": 1.0
            },
            "audio": { "buffer_seconds": 30 },
            "storage": { "meetings_dir": "/srv/meetings" }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.backend.url == "http://10.0.0.1:9090");
        REQUIRE(cfg.backend.api_format == "parakeet");
        REQUIRE(cfg.backend.language == "de");
        REQUIRE(cfg.backend.timeout_s == 300);
        REQUIRE(cfg.diarization.url == "http://10.0.0.2:8090");
        REQUIRE_THAT(cfg.diarization.threshold, WithinAbs(0.6, 1e-6));
        REQUIRE_THAT(cfg.diarization.min_duration, WithinAbs(0.5, 1e-6));
        REQUIRE_THAT(cfg.diarization.merge_gap, WithinAbs(1.0, 1e-6));
        REQUIRE(cfg.audio.buffer_seconds == 30);
        REQUIRE(cfg.meetings_dir() == "/srv/meetings");
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "backend": { "language": "fr" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.backend.language == "fr");
        // Other fields retain defaults
        REQUIRE(cfg.backend.type == "lan");
        REQUIRE(cfg.backend.url == "http://localhost:8080");
        REQUIRE(cfg.diarization.url == "http://localhost:8090");
        REQUIRE(cfg.audio.buffer_seconds == 10);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.backend.type == "lan");
        REQUIRE(cfg.audio.buffer_seconds == 10);
    }

    SECTION("WrongTypeFallsBackToDefaults") {
        TmpFile f(R"({ "backend": { "url": "http://a" }, "audio": { "buffer_seconds": "many" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.backend.url == "http://localhost:8080");
        REQUIRE(cfg.audio.buffer_seconds == 10);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/meetcap_test_nonexistent_config_file.json");
        REQUIRE(cfg.backend.type == "lan");
        REQUIRE(cfg.audio.buffer_seconds == 10);
    }

    SECTION("MeetingsDirDefaultsUnderDataDir") {
        ::setenv("XDG_DATA_HOME", "/tmp/meetcap_xdg_data", 1);
        Config cfg;
        REQUIRE(cfg.meetings_dir() == "/tmp/meetcap_xdg_data/meetcap/meetings");
    }
}
