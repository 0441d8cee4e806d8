#include "platform/linux/pipewire_capture.hpp"

#include <print>
#include <span>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>

PipeWireCapture::PipeWireCapture(RingBuffer& ring_buf, uint32_t sample_rate,
                                 ErrorCallback on_error)
    : ring_buf_(ring_buf), sample_rate_(sample_rate), on_error_(std::move(on_error)) {
    pw_init(nullptr, nullptr);
}

PipeWireCapture::~PipeWireCapture() {
    stop();
    pw_deinit();
}

bool PipeWireCapture::probe() {
    pw_init(nullptr, nullptr);

    bool ok = false;
    auto* loop = pw_main_loop_new(nullptr);
    if (loop) {
        auto* context = pw_context_new(pw_main_loop_get_loop(loop), nullptr, 0);
        if (context) {
            auto* core = pw_context_connect(context, nullptr, 0);
            if (core) {
                ok = true;
                pw_core_disconnect(core);
            } else {
                std::println(stderr, "audio: cannot connect to pipewire");
            }
            pw_context_destroy(context);
        }
        pw_main_loop_destroy(loop);
    }

    pw_deinit();
    return ok;
}

bool PipeWireCapture::start() {
    if (capturing_.load(std::memory_order_relaxed)) return true;

    loop_ = pw_thread_loop_new("meetcap", nullptr);
    if (!loop_) {
        std::println(stderr, "audio: failed to create thread loop");
        return false;
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "meetcap",
        PW_KEY_APP_NAME, "meetcap",
        nullptr
    );

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "meetcap-capture",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        std::println(stderr, "audio: failed to create stream");
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return false;
    }

    // S16_LE, mono, sample_rate_
    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = sample_rate_,
        .channels = 1
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    ring_buf_.reset();
    capturing_.store(true, std::memory_order_release);

    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
        ),
        params, 1
    );

    if (ret >= 0) {
        ret = pw_thread_loop_start(loop_);
        if (ret < 0) {
            std::println(stderr, "audio: thread loop start failed: {}", spa_strerror(ret));
        }
    } else {
        std::println(stderr, "audio: stream connect failed: {}", spa_strerror(ret));
    }

    if (ret < 0) {
        capturing_.store(false, std::memory_order_release);
        pw_stream_destroy(stream_);
        stream_ = nullptr;
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return false;
    }

    return true;
}

void PipeWireCapture::stop() {
    if (!capturing_.load(std::memory_order_relaxed)) return;

    capturing_.store(false, std::memory_order_release);

    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }

    if (auto n = ring_buf_.dropped(); n > 0) {
        std::println(stderr, "audio: dropped {} samples (ring full)", n);
    }
}

void PipeWireCapture::on_process(void* userdata) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (!d->data) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    auto* data = reinterpret_cast<const int16_t*>(
        static_cast<const uint8_t*>(d->data) + d->chunk->offset);
    size_t samples = d->chunk->size / sizeof(int16_t);

    if (self->capturing_.load(std::memory_order_relaxed)) {
        self->ring_buf_.write(std::span(data, samples));
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireCapture::on_state_changed(void* userdata, enum pw_stream_state old,
                                       enum pw_stream_state state, const char* error) {
    auto* self = static_cast<PipeWireCapture*>(userdata);
    if (error) {
        std::println(stderr, "audio: stream state {} -> {}: {}",
                     pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state),
                     error);
    }
    if (state == PW_STREAM_STATE_ERROR && self->on_error_) {
        self->on_error_(error ? error : "audio stream error");
    }
}
