#include "daemon_core.hpp"

#include "inference/lan_backend.hpp"
#include "inference/lan_diarization_model.hpp"
#include "inference/lan_health_check.hpp"
#include "meeting/meeting_export.hpp"

#include <algorithm>
#include <format>
#include <print>

using json = nlohmann::json;

namespace {

json error(const std::string& message) {
    return {{"status", "error"}, {"message", message}};
}

json ok() {
    return {{"status", "ok"}};
}

std::optional<std::string> string_param(const json& cmd, const char* key) {
    auto it = cmd.find(key);
    if (it == cmd.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose, IpcServer& ipc,
                       AudioSourceFactory make_source, Dispatcher post)
    : config_(std::move(config)), verbose_(verbose), ipc_(ipc),
      make_source_(std::move(make_source)), post_(std::move(post)) {}

DaemonCore::~DaemonCore() = default;

bool DaemonCore::init() {
    if (config_.backend.type != "lan") {
        std::println(stderr, "Unknown backend type: {}", config_.backend.type);
        return false;
    }

    Services services;
    services.backend = std::make_unique<LanBackend>(
        config_.backend.url, config_.backend.api_format,
        config_.backend.language, config_.backend.timeout_s);
    services.readiness = std::make_unique<LanHealthCheck>(config_.backend.url);
    services.diarization_loader = [url = config_.diarization.url,
                                   timeout = config_.backend.timeout_s] {
        return LanDiarizationModel::load(url, timeout);
    };
    return init(std::move(services));
}

bool DaemonCore::init(Services services) {
    if (!services.backend || !services.readiness || !services.diarization_loader) {
        std::println(stderr, "daemon: incomplete inference services");
        return false;
    }

    backend_ = std::move(services.backend);
    readiness_ = std::move(services.readiness);

    DiarizationParams params{
        .threshold = config_.diarization.threshold,
        .min_duration = config_.diarization.min_duration,
        .merge_gap = config_.diarization.merge_gap,
    };
    diarizer_ = std::make_unique<DiarizationEngine>(std::move(services.diarization_loader), params);
    pipeline_ = std::make_unique<TranscriptionPipeline>(*diarizer_, *backend_, *readiness_);

    auto dir = config_.meetings_dir();
    store_ = std::make_unique<MeetingStore>(dir);
    log(std::format("Meeting store at {} ({} meetings)", dir, store_->summaries().size()));

    capture_ = std::make_unique<CaptureManager>(
        *store_, *pipeline_, *readiness_,
        [this]() { return make_source_(*backend_); },
        post_);

    capture_->subscribe([this](const CaptureEvent& e) { on_capture_event(e); });
    store_->subscribe([this]() { on_store_changed(); });
    return true;
}

std::optional<json> DaemonCore::handle_command(int client_fd, const json& cmd) {
    if (!cmd.is_object()) return error("malformed request");

    auto name = cmd.value("cmd", "");
    if (name == "start") return handle_start(client_fd, cmd);
    if (name == "stop") return handle_stop(client_fd, cmd);
    if (name == "status") return handle_status(cmd);
    if (name == "list") return handle_list(cmd);
    if (name == "show") return handle_show(cmd);
    if (name == "rename") return handle_rename(cmd);
    if (name == "delete") return handle_delete(cmd);
    if (name == "folders") return handle_folders(cmd);
    if (name == "folder-create") return handle_folder_create(cmd);
    if (name == "folder-rename") return handle_folder_rename(cmd);
    if (name == "folder-delete") return handle_folder_delete(cmd);
    if (name == "move") return handle_move(cmd);
    if (name == "export") return handle_export(cmd);
    if (name == "clear") return handle_clear(cmd);
    if (name == "watch") return handle_watch(client_fd);
    return error("unknown command");
}

std::optional<json> DaemonCore::handle_start(int client_fd, const json& cmd) {
    if (capture_->is_active() || capture_->is_starting()) {
        return error("a meeting is already in progress");
    }

    if (!capture_->begin_start_meeting(string_param(cmd, "title"),
                                       [this](bool started) { on_start_finished(started); })) {
        return error(capture_->last_error().value_or("Unable to start meeting capture."));
    }

    start_client_ = client_fd;
    return std::nullopt;
}

void DaemonCore::on_start_finished(bool started) {
    json response;
    if (started) {
        auto id = *capture_->active_meeting_id();
        log("Recording started: " + id);
        response = {{"status", "ok"}, {"meeting_id", id}};
    } else {
        response = error(capture_->last_error().value_or("Unable to start meeting capture."));
    }

    if (start_client_) {
        ipc_.send_response(*start_client_, response);
        start_client_.reset();
    }
}

std::optional<json> DaemonCore::handle_stop(int client_fd, const json& cmd) {
    if (!capture_->is_active()) {
        return error("not recording");
    }

    auto id = *capture_->active_meeting_id();
    if (capture_->state() == CaptureState::Recording) {
        log(std::format("Recording stopped after {:.1f}s, processing...",
                        capture_->recording_duration()));
        capture_->stop_meeting();
    }

    // The stop may have completed synchronously.
    if (cmd.value("wait", true) && capture_->is_active()) {
        waiting_clients_.push_back(client_fd);
        return std::nullopt;
    }

    return json{{"status", "ok"}, {"meeting_id", id}, {"state", "processing"}};
}

json DaemonCore::handle_status(const json& /*cmd*/) {
    json resp = {{"status", "ok"}, {"state", std::string(to_string(capture_->state()))}};
    if (auto& id = capture_->active_meeting_id()) {
        resp["meeting_id"] = *id;
    }
    if (capture_->state() == CaptureState::Recording) {
        resp["duration"] = capture_->recording_duration();
    }
    if (auto& err = capture_->last_error()) {
        resp["last_error"] = *err;
    }
    return resp;
}

json DaemonCore::handle_list(const json& cmd) {
    std::vector<MeetingSummary> summaries;
    if (auto folder = string_param(cmd, "folder")) {
        if (*folder == "unfiled") {
            summaries = store_->unfiled_summaries();
        } else if (store_->folder(*folder)) {
            summaries = store_->summaries_for_folder(*folder);
        } else {
            return error("unknown folder");
        }
    } else {
        summaries = store_->summaries();
    }
    return {{"status", "ok"}, {"meetings", summaries}};
}

json DaemonCore::handle_show(const json& cmd) {
    auto id = string_param(cmd, "id");
    if (!id) return error("missing id");

    auto m = store_->meeting(*id);
    if (!m) return error("meeting not found");
    return {{"status", "ok"}, {"meeting", *m}};
}

json DaemonCore::handle_rename(const json& cmd) {
    auto id = string_param(cmd, "id");
    auto title = string_param(cmd, "title");
    if (!id || !title) return error("missing id or title");

    if (!store_->meeting(*id)) return error("meeting not found");
    if (!store_->rename_meeting(*id, *title)) return error("title must not be empty");
    return ok();
}

json DaemonCore::handle_delete(const json& cmd) {
    auto id = string_param(cmd, "id");
    if (!id) return error("missing id");

    if (capture_->active_meeting_id() == id) {
        return error("meeting is still being captured");
    }
    if (!store_->meeting(*id)) return error("meeting not found");

    store_->delete_meeting(*id);
    return ok();
}

json DaemonCore::handle_folders(const json& /*cmd*/) {
    return {{"status", "ok"}, {"folders", store_->folders()}};
}

json DaemonCore::handle_folder_create(const json& cmd) {
    auto name = string_param(cmd, "name");
    if (!name) return error("missing name");

    auto folder = store_->create_folder(*name);
    if (!folder) return error("folder name must not be empty");
    return {{"status", "ok"}, {"folder", *folder}};
}

json DaemonCore::handle_folder_rename(const json& cmd) {
    auto id = string_param(cmd, "id");
    auto name = string_param(cmd, "name");
    if (!id || !name) return error("missing id or name");

    if (!store_->folder(*id)) return error("unknown folder");
    if (!store_->rename_folder(*id, *name)) return error("folder name must not be empty");
    return ok();
}

json DaemonCore::handle_folder_delete(const json& cmd) {
    auto id = string_param(cmd, "id");
    if (!id) return error("missing id");

    if (!store_->delete_folder(*id)) return error("unknown folder");
    return ok();
}

json DaemonCore::handle_move(const json& cmd) {
    auto id = string_param(cmd, "id");
    if (!id) return error("missing id");

    auto folder = string_param(cmd, "folder");
    if (folder && !store_->folder(*folder)) return error("unknown folder");
    if (!store_->move_meeting(*id, folder)) return error("meeting not found");
    return ok();
}

json DaemonCore::handle_export(const json& cmd) {
    auto id = string_param(cmd, "id");
    if (!id) return error("missing id");

    auto format = export_format_from_string(string_param(cmd, "format").value_or("txt"));
    if (!format) return error("unknown export format");

    auto m = store_->meeting(*id);
    if (!m) return error("meeting not found");
    return {{"status", "ok"}, {"text", export_meeting(*m, *format)}};
}

json DaemonCore::handle_clear(const json& /*cmd*/) {
    if (capture_->is_active()) {
        return error("a meeting is in progress");
    }
    store_->clear_all();
    log("All meetings cleared");
    return ok();
}

json DaemonCore::handle_watch(int client_fd) {
    if (std::ranges::find(watchers_, client_fd) == watchers_.end()) {
        watchers_.push_back(client_fd);
    }
    return {{"status", "ok"}, {"watching", true}};
}

void DaemonCore::on_capture_event(const CaptureEvent& event) {
    json msg = {{"event", std::string(to_string(event.kind))}, {"meeting_id", event.meeting_id}};
    if (!event.message.empty()) msg["message"] = event.message;

    bool terminal = event.kind == CaptureEvent::Kind::Completed ||
                    event.kind == CaptureEvent::Kind::Failed;
    if (terminal) {
        msg["utterances"] = event.utterance_count;
        log(std::format("Meeting {} {}: {} utterances{}", event.meeting_id,
                        to_string(event.kind), event.utterance_count,
                        event.message.empty() ? "" : " (" + event.message + ")"));
    }

    broadcast(msg);

    if (!terminal || waiting_clients_.empty()) return;

    json response = {
        {"status", event.kind == CaptureEvent::Kind::Completed ? "ok" : "error"},
        {"meeting_id", event.meeting_id},
        {"state", std::string(to_string(event.kind))},
        {"utterances", event.utterance_count},
    };
    if (!event.message.empty()) response["message"] = event.message;

    for (int fd : waiting_clients_) {
        ipc_.send_response(fd, response);
    }
    waiting_clients_.clear();
}

void DaemonCore::on_store_changed() {
    broadcast({{"event", "store_changed"}});
}

void DaemonCore::broadcast(const json& event) {
    std::erase_if(watchers_, [&](int fd) { return !ipc_.send_response(fd, event); });
}

void DaemonCore::remove_client(int fd) {
    if (start_client_ == fd) start_client_.reset();
    std::erase(waiting_clients_, fd);
    std::erase(watchers_, fd);
}

void DaemonCore::shutdown() {
    if (!capture_) return;
    if (capture_->is_active()) {
        log("Waiting for the current meeting to finish processing...");
    }
    capture_->shutdown();
}

void DaemonCore::flush() {
    if (store_) store_->flush();
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[meetcap] {}", msg);
    }
}
