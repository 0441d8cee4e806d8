#pragma once

#include "../inference/backend.hpp"
#include "diarization_engine.hpp"
#include "meeting.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

// Turns a finished session into speaker-attributed utterances.
//
// The whole-session transcript is the fallback: whenever PCM is missing, the models
// are not ready, diarization fails or finds nothing, or no segment yields text, the
// result is a single speaker-0 utterance spanning [0, duration]. An empty transcript
// gives no fallback utterance. Failures never escape utterances().
class TranscriptionPipeline {
public:
    static constexpr uint32_t sample_rate = 16000;

    TranscriptionPipeline(DiarizationEngine& diarizer, TranscriptionBackend& transcriber,
                          ModelReadiness& readiness);

    std::vector<Utterance> utterances(const std::string& transcript, double duration_s,
                                      std::span<const int16_t> pcm);

    static std::vector<Utterance> fallback_utterances(const std::string& transcript,
                                                      double duration_s);

private:
    std::expected<std::vector<Utterance>, std::string>
        transcribe_segments(std::vector<DiarizationSegment> segments,
                            std::span<const int16_t> pcm);

    DiarizationEngine& diarizer_;
    TranscriptionBackend& transcriber_;
    ModelReadiness& readiness_;
};
