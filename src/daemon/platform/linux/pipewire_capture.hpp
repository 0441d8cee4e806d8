#pragma once

#include "ring_buffer.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>
#include <string>

// Mono S16 microphone stream into a RingBuffer. on_error runs on the PipeWire
// thread when the stream enters the error state.
class PipeWireCapture {
public:
    using ErrorCallback = std::function<void(std::string message)>;

    PipeWireCapture(RingBuffer& ring_buf, uint32_t sample_rate, ErrorCallback on_error = {});
    ~PipeWireCapture();

    PipeWireCapture(const PipeWireCapture&) = delete;
    PipeWireCapture& operator=(const PipeWireCapture&) = delete;

    bool start();
    void stop();
    bool is_capturing() const { return capturing_.load(std::memory_order_relaxed); }

    // True if a PipeWire core connection can be established. Used as the
    // microphone access check: a sandbox without the portal fails here.
    static bool probe();

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    RingBuffer& ring_buf_;
    uint32_t sample_rate_;
    ErrorCallback on_error_;
    std::atomic<bool> capturing_{false};

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
