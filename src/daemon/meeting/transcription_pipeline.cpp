#include "transcription_pipeline.hpp"

#include <algorithm>
#include <cmath>
#include <print>

TranscriptionPipeline::TranscriptionPipeline(DiarizationEngine& diarizer,
                                             TranscriptionBackend& transcriber,
                                             ModelReadiness& readiness)
    : diarizer_(diarizer), transcriber_(transcriber), readiness_(readiness) {}

std::vector<Utterance> TranscriptionPipeline::utterances(const std::string& transcript,
                                                         double duration_s,
                                                         std::span<const int16_t> pcm) {
    auto fallback = fallback_utterances(transcript, duration_s);
    if (pcm.empty()) return fallback;

    try {
        if (!readiness_.is_ready()) return fallback;

        auto segments = diarizer_.diarize(pcm, sample_rate);
        if (!segments) {
            std::println(stderr, "pipeline: diarization failed: {}", segments.error());
            return fallback;
        }
        if (segments->empty()) return fallback;

        auto per_speaker = transcribe_segments(std::move(*segments), pcm);
        if (!per_speaker) {
            std::println(stderr, "pipeline: segment transcription failed: {}", per_speaker.error());
            return fallback;
        }
        return per_speaker->empty() ? fallback : std::move(*per_speaker);
    } catch (const std::exception& e) {
        std::println(stderr, "pipeline: diarization pipeline failed: {}", e.what());
        return fallback;
    }
}

std::expected<std::vector<Utterance>, std::string>
TranscriptionPipeline::transcribe_segments(std::vector<DiarizationSegment> segments,
                                           std::span<const int16_t> pcm) {
    std::ranges::stable_sort(segments, {}, &DiarizationSegment::start);

    const auto total_samples = static_cast<int64_t>(pcm.size());
    std::vector<Utterance> out;
    out.reserve(segments.size());

    for (const auto& seg : segments) {
        if (!std::isfinite(seg.start) || !std::isfinite(seg.end)) continue;

        // Clamp into the captured range before truncating; server times are unbounded.
        const auto limit = static_cast<double>(total_samples);
        auto start = static_cast<int64_t>(std::clamp(seg.start * sample_rate, 0.0, limit));
        auto end = static_cast<int64_t>(std::clamp(seg.end * sample_rate, 0.0, limit));
        if (end <= start) continue;

        auto slice = pcm.subspan(static_cast<size_t>(start), static_cast<size_t>(end - start));
        if (slice.empty()) continue;

        auto result = transcriber_.transcribe(slice, sample_rate);
        if (!result) return std::unexpected(result.error());

        auto text = trim(result->text);
        if (text.empty()) continue;

        out.push_back(Utterance::make(std::max(seg.speaker, 0), seg.start, seg.end,
                                      std::move(text)));
    }

    return out;
}

std::vector<Utterance> TranscriptionPipeline::fallback_utterances(const std::string& transcript,
                                                                  double duration_s) {
    auto text = trim(transcript);
    if (text.empty()) return {};
    return {Utterance::make(0, 0.0, std::max(duration_s, 0.0), std::move(text))};
}
