#pragma once

#include "../inference/backend.hpp"
#include "../platform/audio_source.hpp"
#include "../storage/meeting_store.hpp"
#include "meeting.hpp"
#include "transcription_pipeline.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

enum class CaptureState { Idle, Recording, Processing };

std::string_view to_string(CaptureState state);

struct CaptureEvent {
    enum class Kind { Started, Processing, Completed, Failed };

    Kind kind;
    std::string meeting_id;
    std::string message;
    size_t utterance_count = 0;
};

std::string_view to_string(CaptureEvent::Kind kind);

// Meeting session state machine: Idle -> Recording -> Processing -> Idle.
//
// At most one session is Recording or Processing. Every method must be called on
// the owner thread; audio callbacks and pipeline results are marshalled back onto
// it through the Dispatcher, never applied from the worker that produced them.
class CaptureManager {
public:
    using AudioSourceFactory = std::function<std::unique_ptr<AudioSource>()>;
    using Dispatcher = std::function<void(std::function<void()>)>;
    using Listener = std::function<void(const CaptureEvent&)>;
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using StartCallback = std::function<void(bool started)>;

    CaptureManager(MeetingStore& store, TranscriptionPipeline& pipeline,
                   ModelReadiness& readiness, AudioSourceFactory make_source,
                   Dispatcher post,
                   Clock clock = [] { return std::chrono::steady_clock::now(); });
    ~CaptureManager();

    CaptureManager(const CaptureManager&) = delete;
    CaptureManager& operator=(const CaptureManager&) = delete;

    bool start_meeting(const std::optional<std::string>& title = std::nullopt);

    // Same as start_meeting(), but the source, permission and readiness checks
    // run on a worker thread so the owner thread never blocks on them. done is
    // called on the owner thread with the result. Returns false without calling
    // done if a session or another start is already under way.
    bool begin_start_meeting(std::optional<std::string> title, StartCallback done);

    void stop_meeting();

    // Stops an in-progress recording and refuses a start still in its checks.
    // Processing still runs to completion.
    void shutdown();

    CaptureState state() const { return state_; }
    bool is_active() const { return state_ != CaptureState::Idle; }
    bool is_starting() const { return starting_; }
    const std::optional<std::string>& active_meeting_id() const { return active_meeting_id_; }
    const std::optional<std::string>& last_error() const { return last_error_; }
    double recording_duration() const;

    void subscribe(Listener listener);

private:
    struct StartCheck {
        std::unique_ptr<AudioSource> source;
        std::optional<std::string> error;
    };

    // Touches only make_source_ and readiness_; safe off the owner thread.
    StartCheck check_start();
    bool launch(std::unique_ptr<AudioSource> source, const std::optional<std::string>& title);
    void finish_start(StartCheck check, const std::optional<std::string>& title,
                      StartCallback done);

    void handle_transcript(uint64_t session, std::string transcript);
    void handle_failure(uint64_t session, std::string reason);
    void finish_session(uint64_t session, std::vector<Utterance> utterances);
    bool is_current(uint64_t session) const;
    void join_worker();
    void reset_state();
    void emit(CaptureEvent event);

    MeetingStore& store_;
    TranscriptionPipeline& pipeline_;
    ModelReadiness& readiness_;
    AudioSourceFactory make_source_;
    Dispatcher post_;
    Clock clock_;

    CaptureState state_ = CaptureState::Idle;
    std::optional<std::string> active_meeting_id_;
    std::optional<std::string> last_error_;
    std::optional<std::chrono::steady_clock::time_point> started_at_;
    std::unique_ptr<AudioSource> source_;
    uint64_t session_ = 0;
    bool starting_ = false;
    bool shutting_down_ = false;

    std::vector<Listener> listeners_;
    std::jthread start_worker_;
    std::jthread worker_;
};
