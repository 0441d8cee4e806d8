#include "platform/linux/pipewire_audio_source.hpp"

#include <algorithm>
#include <chrono>
#include <print>

PipeWireAudioSource::PipeWireAudioSource(TranscriptionBackend& backend, int buffer_seconds)
    : backend_(backend),
      ring_(static_cast<size_t>(std::max(buffer_seconds, 1)) * sample_rate) {}

PipeWireAudioSource::~PipeWireAudioSource() {
    if (capture_) capture_->stop();
    drain_thread_ = {};
    finish_thread_ = {};
}

bool PipeWireAudioSource::ensure_microphone_permission() {
    return PipeWireCapture::probe();
}

bool PipeWireAudioSource::start_recording(CompleteCallback on_complete,
                                          FailureCallback on_failure) {
    if (capture_) return false;

    {
        std::lock_guard lock(pcm_mutex_);
        pcm_.clear();
    }
    on_complete_ = std::move(on_complete);
    on_failure_ = std::move(on_failure);
    reported_.store(false);

    capture_ = std::make_unique<PipeWireCapture>(ring_, sample_rate,
        [this](std::string message) { fail("Audio capture error: " + message); });

    if (!capture_->start()) {
        capture_.reset();
        return false;
    }

    drain_thread_ = std::jthread([this](std::stop_token st) { drain_loop(st); });
    std::println(stderr, "audio: recording started");
    return true;
}

void PipeWireAudioSource::stop_recording() {
    if (!capture_) return;

    capture_->stop();
    drain_thread_.request_stop();
    if (drain_thread_.joinable()) drain_thread_.join();
    capture_.reset();

    auto pcm = last_captured_pcm();
    std::println(stderr, "audio: recording stopped, {:.1f}s captured",
                 static_cast<double>(pcm.size()) / sample_rate);

    finish_thread_ = std::jthread([this, pcm = std::move(pcm)] {
        if (pcm.empty()) {
            fail("No audio captured.");
            return;
        }
        auto result = backend_.transcribe(pcm, sample_rate);
        if (!result) {
            std::println(stderr, "audio: transcription failed: {}", result.error());
            fail(result.error());
            return;
        }
        complete(std::move(result->text));
    });
}

std::vector<int16_t> PipeWireAudioSource::last_captured_pcm() const {
    std::lock_guard lock(pcm_mutex_);
    return pcm_;
}

void PipeWireAudioSource::drain_loop(std::stop_token st) {
    using namespace std::chrono_literals;
    while (!st.stop_requested()) {
        {
            std::lock_guard lock(pcm_mutex_);
            ring_.drain_into(pcm_);
        }
        std::this_thread::sleep_for(20ms);
    }
    std::lock_guard lock(pcm_mutex_);
    ring_.drain_into(pcm_);
}

void PipeWireAudioSource::fail(std::string reason) {
    if (reported_.exchange(true)) return;
    if (on_failure_) on_failure_(std::move(reason));
}

void PipeWireAudioSource::complete(std::string transcript) {
    if (reported_.exchange(true)) return;
    if (on_complete_) on_complete_(std::move(transcript));
}
