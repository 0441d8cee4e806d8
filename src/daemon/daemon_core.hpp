#pragma once

#include "config.hpp"
#include "inference/backend.hpp"
#include "meeting/capture_manager.hpp"
#include "meeting/diarization_engine.hpp"
#include "meeting/transcription_pipeline.hpp"
#include "platform/audio_source.hpp"
#include "platform/ipc_server.hpp"
#include "storage/meeting_store.hpp"

#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

class DaemonCore {
public:
    using AudioSourceFactory = std::function<std::unique_ptr<AudioSource>(TranscriptionBackend&)>;
    using Dispatcher = CaptureManager::Dispatcher;

    // Inference services; init() without arguments builds the LAN ones from Config.
    struct Services {
        std::unique_ptr<TranscriptionBackend> backend;
        std::unique_ptr<ModelReadiness> readiness;
        DiarizationEngine::ModelLoader diarization_loader;
    };

    DaemonCore(Config config, bool verbose, IpcServer& ipc,
               AudioSourceFactory make_source, Dispatcher post);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    bool init();
    bool init(Services services);

    // Returns the reply for client_fd, or nullopt when the reply is deferred
    // (start, stop with wait) and will be sent later through the IpcServer.
    std::optional<nlohmann::json> handle_command(int client_fd, const nlohmann::json& cmd);

    void remove_client(int fd);

    bool is_idle() const {
        return !capture_ || (!capture_->is_active() && !capture_->is_starting());
    }

    // Stops a recording in progress. The caller keeps dispatching posted work
    // until is_idle(), then calls flush().
    void shutdown();
    void flush();

    MeetingStore& store() { return *store_; }
    CaptureManager& capture() { return *capture_; }

private:
    std::optional<nlohmann::json> handle_start(int client_fd, const nlohmann::json& cmd);
    void on_start_finished(bool started);
    std::optional<nlohmann::json> handle_stop(int client_fd, const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_list(const nlohmann::json& cmd);
    nlohmann::json handle_show(const nlohmann::json& cmd);
    nlohmann::json handle_rename(const nlohmann::json& cmd);
    nlohmann::json handle_delete(const nlohmann::json& cmd);
    nlohmann::json handle_folders(const nlohmann::json& cmd);
    nlohmann::json handle_folder_create(const nlohmann::json& cmd);
    nlohmann::json handle_folder_rename(const nlohmann::json& cmd);
    nlohmann::json handle_folder_delete(const nlohmann::json& cmd);
    nlohmann::json handle_move(const nlohmann::json& cmd);
    nlohmann::json handle_export(const nlohmann::json& cmd);
    nlohmann::json handle_clear(const nlohmann::json& cmd);
    nlohmann::json handle_watch(int client_fd);

    void on_capture_event(const CaptureEvent& event);
    void on_store_changed();
    void broadcast(const nlohmann::json& event);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    IpcServer& ipc_;
    AudioSourceFactory make_source_;
    Dispatcher post_;

    std::unique_ptr<TranscriptionBackend> backend_;
    std::unique_ptr<ModelReadiness> readiness_;
    std::unique_ptr<DiarizationEngine> diarizer_;
    std::unique_ptr<TranscriptionPipeline> pipeline_;
    std::unique_ptr<MeetingStore> store_;
    std::unique_ptr<CaptureManager> capture_;

    std::optional<int> start_client_;
    std::vector<int> waiting_clients_;
    std::vector<int> watchers_;
};
