#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string Config::meetings_dir() const {
    if (!storage.meetings_dir.empty()) return storage.meetings_dir;
    auto data = platform::data_dir();
    if (data.empty()) return "/tmp/meetcap/meetings";
    return data + "/meetings";
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);
        Config parsed;

        if (j.contains("backend")) {
            auto& b = j["backend"];
            if (b.contains("type")) parsed.backend.type = b["type"].get<std::string>();
            if (b.contains("url")) parsed.backend.url = b["url"].get<std::string>();
            if (b.contains("api_format")) parsed.backend.api_format = b["api_format"].get<std::string>();
            if (b.contains("language")) parsed.backend.language = b["language"].get<std::string>();
            if (b.contains("timeout_s")) parsed.backend.timeout_s = b["timeout_s"].get<long>();
        }

        if (j.contains("diarization")) {
            auto& d = j["diarization"];
            if (d.contains("url")) parsed.diarization.url = d["url"].get<std::string>();
            if (d.contains("threshold")) parsed.diarization.threshold = d["threshold"].get<float>();
            if (d.contains("min_duration")) parsed.diarization.min_duration = d["min_duration"].get<float>();
            if (d.contains("merge_gap")) parsed.diarization.merge_gap = d["merge_gap"].get<float>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("buffer_seconds")) parsed.audio.buffer_seconds = a["buffer_seconds"].get<int>();
        }

        if (j.contains("storage")) {
            auto& s = j["storage"];
            if (s.contains("meetings_dir")) parsed.storage.meetings_dir = s["meetings_dir"].get<std::string>();
        }

        cfg = std::move(parsed);
    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
