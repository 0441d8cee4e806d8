#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

// One recording session's worth of microphone capture. Callbacks may fire on any
// thread; exactly one of them fires per successful start_recording().
class AudioSource {
public:
    using CompleteCallback = std::function<void(std::string transcript)>;
    using FailureCallback = std::function<void(std::string reason)>;

    // Raw PCM is mono, signed 16-bit, native (little) endian at this rate.
    static constexpr uint32_t sample_rate = 16000;

    virtual ~AudioSource() = default;

    virtual bool ensure_microphone_permission() = 0;
    virtual bool start_recording(CompleteCallback on_complete, FailureCallback on_failure) = 0;
    virtual void stop_recording() = 0;

    // Everything captured by the last session. Valid once on_complete has fired.
    virtual std::vector<int16_t> last_captured_pcm() const = 0;
};
