#pragma once

#include "inference/backend.hpp"
#include "platform/audio_source.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "ring_buffer.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

// Records the default PipeWire source for the length of a session, then
// transcribes the whole capture in one request on a worker thread.
class PipeWireAudioSource : public AudioSource {
public:
    PipeWireAudioSource(TranscriptionBackend& backend, int buffer_seconds);
    ~PipeWireAudioSource() override;

    PipeWireAudioSource(const PipeWireAudioSource&) = delete;
    PipeWireAudioSource& operator=(const PipeWireAudioSource&) = delete;

    bool ensure_microphone_permission() override;
    bool start_recording(CompleteCallback on_complete, FailureCallback on_failure) override;
    void stop_recording() override;
    std::vector<int16_t> last_captured_pcm() const override;

private:
    void drain_loop(std::stop_token st);
    void fail(std::string reason);
    void complete(std::string transcript);

    TranscriptionBackend& backend_;
    RingBuffer ring_;
    std::unique_ptr<PipeWireCapture> capture_;

    mutable std::mutex pcm_mutex_;
    std::vector<int16_t> pcm_;

    CompleteCallback on_complete_;
    FailureCallback on_failure_;
    std::atomic<bool> reported_{false};

    std::jthread drain_thread_;
    std::jthread finish_thread_;
};
