#include "lan_backend.hpp"
#include "../strings.hpp"
#include "../wav_encoder.hpp"

#include <chrono>
#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

LanBackend::LanBackend(std::string url, std::string api_format, std::string language,
                       long timeout_s)
    : url_(std::move(url)), api_format_(std::move(api_format)),
      language_(std::move(language)), http_opts_{.timeout_s = timeout_s} {}

std::expected<TranscriptResult, std::string>
LanBackend::transcribe(std::span<const int16_t> audio, uint32_t sample_rate) {
    if (audio.empty()) {
        return std::unexpected("empty audio");
    }

    double duration_s = static_cast<double>(audio.size()) / sample_rate;
    auto wav_data = wav::encode(audio, sample_rate);

    auto start = std::chrono::steady_clock::now();
    auto resp = send(wav_data);
    auto end = std::chrono::steady_clock::now();

    if (!resp) return std::unexpected(resp.error());
    if (resp->status >= 400) {
        return std::unexpected(std::format("server returned HTTP {}: {}", resp->status, resp->body));
    }

    auto text = parse_transcript_response(resp->body);
    if (!text) return std::unexpected(text.error());

    return TranscriptResult{
        .text = std::move(*text),
        .duration_s = duration_s,
        .processing_s = std::chrono::duration<double>(end - start).count(),
    };
}

std::expected<http::Response, std::string> LanBackend::send(const std::vector<uint8_t>& wav_data) {
    std::string wav_str(reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
    http::FormPart file{.name = "file", .data = std::move(wav_str),
                        .filename = "audio.wav", .content_type = "audio/wav"};

    if (api_format_ == "parakeet") {
        return http::post_body(url_ + "/transcribe", wav_data, "audio/wav", http_opts_);
    }

    if (api_format_ == "openai") {
        return http::post_form(url_ + "/v1/audio/transcriptions", {
            std::move(file),
            {.name = "model", .data = "whisper-1"},
            {.name = "language", .data = language_},
            {.name = "response_format", .data = "json"},
        }, http_opts_);
    }

    // whisper.cpp server format
    std::vector<http::FormPart> parts = {
        std::move(file),
        {.name = "temperature", .data = "0.0"},
        {.name = "response_format", .data = "json"},
    };
    if (!language_.empty()) {
        parts.push_back({.name = "language", .data = language_});
    }
    return http::post_form(url_ + "/inference", parts, http_opts_);
}

std::expected<std::string, std::string> parse_transcript_response(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (j.contains("text")) {
            return trim(j["text"].get<std::string>());
        }
        if (j.contains("error")) {
            return std::unexpected("server error: " + j["error"].get<std::string>());
        }
        return std::unexpected("unexpected response: " + body);
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}
