#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

struct DiarizationSegment {
    double start = 0.0; // seconds
    double end = 0.0;
    int speaker = 0;    // may be negative for "unknown"
};

struct DiarizationParams {
    float threshold = 0.5f;
    float min_duration = 0.25f;
    float merge_gap = 0.35f;
};

// A loaded speaker-segmentation model. Segments come back in no particular order.
class DiarizationModel {
public:
    virtual ~DiarizationModel() = default;
    virtual std::expected<std::vector<DiarizationSegment>, std::string>
        generate(std::span<const float> samples, uint32_t sample_rate,
                 const DiarizationParams& params) = 0;
};
