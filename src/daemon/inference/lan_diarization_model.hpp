#pragma once

#include "diarization_model.hpp"
#include "http.hpp"

#include <memory>
#include <string>

// Speaker segmentation served by a diarization server on the local network.
class LanDiarizationModel : public DiarizationModel {
public:
    // Probes <url>/health; fails if the server or its model is not up.
    static std::expected<std::shared_ptr<DiarizationModel>, std::string>
        load(const std::string& url, long timeout_s = 0);

    explicit LanDiarizationModel(std::string url, long timeout_s = 0);

    std::expected<std::vector<DiarizationSegment>, std::string>
        generate(std::span<const float> samples, uint32_t sample_rate,
                 const DiarizationParams& params) override;

private:
    std::string url_;
    http::Options http_opts_;
};

std::expected<std::vector<DiarizationSegment>, std::string>
    parse_diarization_response(const std::string& body);
