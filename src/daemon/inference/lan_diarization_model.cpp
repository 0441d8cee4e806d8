#include "lan_diarization_model.hpp"
#include "lan_health_check.hpp"
#include "../wav_encoder.hpp"

#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::expected<std::shared_ptr<DiarizationModel>, std::string>
LanDiarizationModel::load(const std::string& url, long timeout_s) {
    auto resp = http::get(url + "/health", {.timeout_s = 30, .connect_timeout_s = 5});
    if (!resp) return std::unexpected(resp.error());
    if (!is_healthy_response(*resp)) {
        return std::unexpected(std::format("diarization server at {} not ready (HTTP {})",
                                           url, resp->status));
    }
    return std::make_shared<LanDiarizationModel>(url, timeout_s);
}

LanDiarizationModel::LanDiarizationModel(std::string url, long timeout_s)
    : url_(std::move(url)), http_opts_{.timeout_s = timeout_s} {}

std::expected<std::vector<DiarizationSegment>, std::string>
LanDiarizationModel::generate(std::span<const float> samples, uint32_t sample_rate,
                              const DiarizationParams& params) {
    auto wav_data = wav::encode_float(samples, sample_rate);
    std::string wav_str(reinterpret_cast<const char*>(wav_data.data()), wav_data.size());

    auto resp = http::post_form(url_ + "/diarize", {
        {.name = "file", .data = std::move(wav_str),
         .filename = "audio.wav", .content_type = "audio/wav"},
        {.name = "threshold", .data = std::format("{}", params.threshold)},
        {.name = "min_duration", .data = std::format("{}", params.min_duration)},
        {.name = "merge_gap", .data = std::format("{}", params.merge_gap)},
    }, http_opts_);

    if (!resp) return std::unexpected(resp.error());
    if (resp->status >= 400) {
        return std::unexpected(std::format("server returned HTTP {}: {}", resp->status, resp->body));
    }
    return parse_diarization_response(resp->body);
}

std::expected<std::vector<DiarizationSegment>, std::string>
parse_diarization_response(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (j.contains("error")) {
            return std::unexpected("server error: " + j["error"].get<std::string>());
        }

        std::vector<DiarizationSegment> segments;
        for (const auto& s : j.at("segments")) {
            segments.push_back({
                .start = s.at("start").get<double>(),
                .end = s.at("end").get<double>(),
                .speaker = s.at("speaker").get<int>(),
            });
        }
        return segments;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}
