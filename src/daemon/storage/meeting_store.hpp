#pragma once

#include "meeting/meeting.hpp"
#include "persistence_writer.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Canonical meeting, folder and summary state.
//
// Mutations update the in-memory cache and return immediately; the meeting body
// and the index document are written by a background PersistenceWriter. Reads are
// consistent with the cache, not with the disk, until that write lands.
//
// Not thread-safe: all calls come from the daemon's event-loop thread.
class MeetingStore {
public:
    using ChangeListener = std::function<void()>;

    explicit MeetingStore(std::filesystem::path root);

    MeetingStore(const MeetingStore&) = delete;
    MeetingStore& operator=(const MeetingStore&) = delete;

    Meeting create_meeting(const std::optional<std::string>& title = std::nullopt);
    bool append_utterance(const Utterance& utterance, const std::string& meeting_id);
    bool finish_meeting(const std::string& id, MeetingStatus status = MeetingStatus::Completed);
    bool mark_meeting_failed(const std::string& id);
    void update_meeting(const Meeting& meeting);
    bool rename_meeting(const std::string& id, const std::string& title);
    void delete_meeting(const std::string& id);

    // Only ids in the index resolve; the body is read from disk on a cache miss.
    std::optional<Meeting> meeting(const std::string& id);

    std::optional<MeetingFolder> create_folder(const std::string& name);
    bool rename_folder(const std::string& id, const std::string& name);
    bool delete_folder(const std::string& id);
    bool move_meeting(const std::string& meeting_id, const std::optional<std::string>& folder_id);

    const std::vector<MeetingSummary>& summaries() const { return summaries_; }
    const std::vector<MeetingFolder>& folders() const { return folders_; }
    std::optional<MeetingFolder> folder(const std::string& id) const;

    std::vector<MeetingSummary> unfiled_summaries() const;
    std::vector<MeetingSummary> summaries_for_folder(const std::string& folder_id) const;

    void clear_all();

    void subscribe(ChangeListener listener);

    // Waits for queued writes. Mutations never call this.
    void flush();

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path index_path() const;
    std::filesystem::path meeting_path(const std::string& id) const;

private:
    void load_index();
    void sort_summaries();
    void save_meeting(const Meeting& meeting);
    void save_index();
    void notify();

    MeetingFolder* find_folder(const std::string& id);
    bool has_summary(const std::string& id) const;

    std::filesystem::path root_;
    std::vector<MeetingSummary> summaries_;
    std::vector<MeetingFolder> folders_;
    std::unordered_map<std::string, Meeting> cache_;
    std::vector<ChangeListener> listeners_;
    PersistenceWriter writer_;
};
