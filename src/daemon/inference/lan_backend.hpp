#pragma once

#include "backend.hpp"
#include "http.hpp"

#include <string>

// Transcription against a speech server on the local network.
class LanBackend : public TranscriptionBackend {
public:
    // api_format: "whisper.cpp", "openai" or "parakeet"
    LanBackend(std::string url, std::string api_format = "whisper.cpp",
               std::string language = "en", long timeout_s = 0);

    std::expected<TranscriptResult, std::string>
        transcribe(std::span<const int16_t> audio, uint32_t sample_rate) override;

private:
    std::expected<http::Response, std::string> send(const std::vector<uint8_t>& wav_data);

    std::string url_;
    std::string api_format_;
    std::string language_;
    http::Options http_opts_;
};

// Extracts and trims "text" from a server reply; "error" replies become errors.
std::expected<std::string, std::string> parse_transcript_response(const std::string& body);
