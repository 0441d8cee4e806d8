#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>

struct TranscriptResult {
    std::string text;
    double duration_s = 0.0;
    double processing_s = 0.0;
};

// Speech-to-text over a mono 16-bit PCM buffer. Used both for the whole-session
// transcript and for each diarized segment.
class TranscriptionBackend {
public:
    virtual ~TranscriptionBackend() = default;
    virtual std::expected<TranscriptResult, std::string>
        transcribe(std::span<const int16_t> audio, uint32_t sample_rate) = 0;
};

// Gates whether recording and the diarization path are attempted at all.
class ModelReadiness {
public:
    virtual ~ModelReadiness() = default;
    virtual bool is_ready() = 0;
};
