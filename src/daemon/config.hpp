#pragma once

#include <string>

struct Config {
    struct Backend {
        std::string type = "lan";
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp", "openai" or "parakeet"
        std::string language = "en";
        long timeout_s = 0;                     // 0 = no limit
    } backend;

    struct Diarization {
        std::string url = "http://localhost:8090";
        float threshold = 0.5f;
        float min_duration = 0.25f;
        float merge_gap = 0.35f;
    } diarization;

    struct Audio {
        int buffer_seconds = 10;
    } audio;

    struct Storage {
        std::string meetings_dir; // empty = <data_dir>/meetings
    } storage;

    // Resolved persistence root.
    std::string meetings_dir() const;

    static Config load(const std::string& path);
    static Config load_default();
};
