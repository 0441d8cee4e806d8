#include "capture_manager.hpp"

#include <print>

std::string_view to_string(CaptureState state) {
    switch (state) {
        case CaptureState::Idle: return "idle";
        case CaptureState::Recording: return "recording";
        case CaptureState::Processing: return "processing";
    }
    return "idle";
}

std::string_view to_string(CaptureEvent::Kind kind) {
    switch (kind) {
        case CaptureEvent::Kind::Started: return "started";
        case CaptureEvent::Kind::Processing: return "processing";
        case CaptureEvent::Kind::Completed: return "completed";
        case CaptureEvent::Kind::Failed: return "failed";
    }
    return "failed";
}

CaptureManager::CaptureManager(MeetingStore& store, TranscriptionPipeline& pipeline,
                               ModelReadiness& readiness, AudioSourceFactory make_source,
                               Dispatcher post, Clock clock)
    : store_(store), pipeline_(pipeline), readiness_(readiness),
      make_source_(std::move(make_source)), post_(std::move(post)),
      clock_(std::move(clock)) {}

CaptureManager::~CaptureManager() {
    if (start_worker_.joinable()) start_worker_.join();
    join_worker();
}

bool CaptureManager::start_meeting(const std::optional<std::string>& title) {
    if (state_ != CaptureState::Idle || starting_) {
        return false;
    }

    auto check = check_start();
    if (check.error) {
        last_error_ = std::move(check.error);
        return false;
    }
    return launch(std::move(check.source), title);
}

bool CaptureManager::begin_start_meeting(std::optional<std::string> title, StartCallback done) {
    if (state_ != CaptureState::Idle || starting_ || shutting_down_) {
        return false;
    }

    starting_ = true;
    if (start_worker_.joinable()) start_worker_.join();
    start_worker_ = std::jthread([this, title = std::move(title), done = std::move(done)] {
        auto check = std::make_shared<StartCheck>(check_start());
        post_([this, check, title, done] {
            finish_start(std::move(*check), title, done);
        });
    });
    return true;
}

void CaptureManager::finish_start(StartCheck check, const std::optional<std::string>& title,
                                  StartCallback done) {
    // The worker's last act was posting this.
    if (start_worker_.joinable() && start_worker_.get_id() != std::this_thread::get_id()) {
        start_worker_.join();
    }
    starting_ = false;

    bool started = false;
    if (shutting_down_) {
        last_error_ = "The daemon is shutting down.";
    } else if (check.error) {
        last_error_ = std::move(check.error);
    } else {
        started = launch(std::move(check.source), title);
    }

    if (done) done(started);
}

CaptureManager::StartCheck CaptureManager::check_start() {
    auto source = make_source_();
    if (!source) {
        return {.source = nullptr, .error = "No audio source available."};
    }

    if (!source->ensure_microphone_permission()) {
        return {.source = nullptr, .error = "Microphone permission not granted."};
    }

    if (!readiness_.is_ready()) {
        return {.source = nullptr,
                .error = "Transcription models are not ready. Check that the transcription server is running."};
    }

    return {.source = std::move(source), .error = std::nullopt};
}

bool CaptureManager::launch(std::unique_ptr<AudioSource> source,
                            const std::optional<std::string>& title) {
    auto meeting = store_.create_meeting(title);
    uint64_t session = ++session_;

    active_meeting_id_ = meeting.id;
    state_ = CaptureState::Recording;
    last_error_.reset();
    started_at_ = clock_();
    source_ = std::move(source);

    bool started = source_->start_recording(
        [this, session](std::string transcript) {
            post_([this, session, transcript = std::move(transcript)]() mutable {
                handle_transcript(session, std::move(transcript));
            });
        },
        [this, session](std::string reason) {
            post_([this, session, reason = std::move(reason)]() mutable {
                handle_failure(session, std::move(reason));
            });
        });

    if (!started) {
        store_.mark_meeting_failed(meeting.id);
        if (!last_error_) {
            last_error_ = "Unable to start meeting capture.";
        }
        reset_state();
        emit({.kind = CaptureEvent::Kind::Failed, .meeting_id = meeting.id,
              .message = *last_error_});
        return false;
    }

    emit({.kind = CaptureEvent::Kind::Started, .meeting_id = meeting.id});
    return true;
}

void CaptureManager::stop_meeting() {
    if (state_ != CaptureState::Recording) return;

    const auto& id = *active_meeting_id_;
    if (auto m = store_.meeting(id); m && m->status == MeetingStatus::Recording) {
        m->status = MeetingStatus::Processing;
        store_.update_meeting(*m);
    }

    state_ = CaptureState::Processing;
    emit({.kind = CaptureEvent::Kind::Processing, .meeting_id = id});
    source_->stop_recording();
}

void CaptureManager::shutdown() {
    shutting_down_ = true;
    if (state_ == CaptureState::Recording) {
        stop_meeting();
    }
}

double CaptureManager::recording_duration() const {
    if (state_ != CaptureState::Recording || !started_at_) return 0.0;
    return std::chrono::duration<double>(clock_() - *started_at_).count();
}

void CaptureManager::subscribe(Listener listener) {
    listeners_.push_back(std::move(listener));
}

void CaptureManager::handle_transcript(uint64_t session, std::string transcript) {
    if (!is_current(session)) return;

    state_ = CaptureState::Processing;

    auto now = clock_();
    double duration = std::chrono::duration<double>(now - started_at_.value_or(now)).count();
    auto pcm = source_ ? source_->last_captured_pcm() : std::vector<int16_t>{};

    join_worker();
    worker_ = std::jthread([this, session, transcript = std::move(transcript), duration,
                            pcm = std::move(pcm)] {
        auto utterances = pipeline_.utterances(transcript, duration, pcm);
        post_([this, session, utterances = std::move(utterances)]() mutable {
            finish_session(session, std::move(utterances));
        });
    });
}

void CaptureManager::handle_failure(uint64_t session, std::string reason) {
    if (!is_current(session)) return;

    if (!reason.empty()) last_error_ = std::move(reason);
    if (!last_error_) last_error_ = "Meeting capture failed.";

    auto id = *active_meeting_id_;
    store_.mark_meeting_failed(id);
    reset_state();
    emit({.kind = CaptureEvent::Kind::Failed, .meeting_id = id, .message = *last_error_});
}

void CaptureManager::finish_session(uint64_t session, std::vector<Utterance> utterances) {
    join_worker();
    if (!is_current(session)) return;

    auto id = *active_meeting_id_;
    for (const auto& u : utterances) {
        store_.append_utterance(u, id);
    }

    CaptureEvent event{.kind = CaptureEvent::Kind::Completed, .meeting_id = id,
                       .utterance_count = utterances.size()};

    if (utterances.empty()) {
        last_error_ = "No speech detected in this recording.";
        store_.mark_meeting_failed(id);
        event.kind = CaptureEvent::Kind::Failed;
        event.message = *last_error_;
    } else {
        last_error_.reset();
        store_.finish_meeting(id, MeetingStatus::Completed);
    }

    reset_state();
    emit(std::move(event));
}

bool CaptureManager::is_current(uint64_t session) const {
    return session == session_ && active_meeting_id_.has_value();
}

void CaptureManager::join_worker() {
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

void CaptureManager::reset_state() {
    source_.reset();
    started_at_.reset();
    active_meeting_id_.reset();
    state_ = CaptureState::Idle;
}

void CaptureManager::emit(CaptureEvent event) {
    for (auto& l : listeners_) l(event);
}
