#include "meeting_store.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

MeetingStore::MeetingStore(fs::path root) : root_(std::move(root)) {
    load_index();
}

fs::path MeetingStore::index_path() const {
    return root_ / "index.json";
}

fs::path MeetingStore::meeting_path(const std::string& id) const {
    return root_ / "items" / (id + ".json");
}

// --- Meeting lifecycle ---

Meeting MeetingStore::create_meeting(const std::optional<std::string>& title) {
    auto now = std::chrono::system_clock::now();
    auto trimmed = trim(title.value_or(""));

    Meeting meeting{
        .id = make_uuid(),
        .title = trimmed.empty() ? default_meeting_title(now) : std::move(trimmed),
        .started_at = now,
        .ended_at = std::nullopt,
        .status = MeetingStatus::Recording,
        .utterances = {},
        .folder_id = std::nullopt,
    };

    cache_[meeting.id] = meeting;
    summaries_.insert(summaries_.begin(), MeetingSummary::from(meeting));
    save_meeting(meeting);
    save_index();
    notify();
    return meeting;
}

bool MeetingStore::append_utterance(const Utterance& utterance, const std::string& meeting_id) {
    auto m = meeting(meeting_id);
    if (!m) return false;
    m->utterances.push_back(utterance);
    update_meeting(*m);
    return true;
}

bool MeetingStore::finish_meeting(const std::string& id, MeetingStatus status) {
    auto m = meeting(id);
    if (!m) return false;
    m->status = status;
    m->ended_at = std::chrono::system_clock::now();
    update_meeting(*m);
    return true;
}

bool MeetingStore::mark_meeting_failed(const std::string& id) {
    return finish_meeting(id, MeetingStatus::Failed);
}

void MeetingStore::update_meeting(const Meeting& meeting) {
    cache_[meeting.id] = meeting;
    auto summary = MeetingSummary::from(meeting);

    auto it = std::ranges::find_if(summaries_, [&](const MeetingSummary& s) {
        return s.id == meeting.id;
    });
    if (it != summaries_.end()) {
        *it = std::move(summary);
    } else {
        summaries_.insert(summaries_.begin(), std::move(summary));
    }

    sort_summaries();
    save_meeting(meeting);
    save_index();
    notify();
}

bool MeetingStore::rename_meeting(const std::string& id, const std::string& title) {
    auto trimmed = trim(title);
    if (trimmed.empty()) return false;
    auto m = meeting(id);
    if (!m) return false;
    m->title = std::move(trimmed);
    update_meeting(*m);
    return true;
}

void MeetingStore::delete_meeting(const std::string& id) {
    cache_.erase(id);
    std::erase_if(summaries_, [&](const MeetingSummary& s) { return s.id == id; });
    for (auto& f : folders_) {
        std::erase(f.meeting_ids, id);
    }

    writer_.remove(meeting_path(id));
    save_index();
    notify();
}

std::optional<Meeting> MeetingStore::meeting(const std::string& id) {
    if (auto it = cache_.find(id); it != cache_.end()) {
        return it->second;
    }

    // The index decides what exists; a body file may outlive its queued removal.
    if (!has_summary(id)) return std::nullopt;

    std::ifstream f(meeting_path(id));
    if (!f.is_open()) return std::nullopt;

    try {
        auto m = json::parse(f).get<Meeting>();
        cache_[id] = m;
        return m;
    } catch (const std::exception& e) {
        std::println(stderr, "store: cannot decode meeting {}: {}", id, e.what());
        return std::nullopt;
    }
}

// --- Folders ---

std::optional<MeetingFolder> MeetingStore::create_folder(const std::string& name) {
    auto trimmed = trim(name);
    if (trimmed.empty()) return std::nullopt;

    MeetingFolder folder{
        .id = make_uuid(),
        .name = std::move(trimmed),
        .created_at = std::chrono::system_clock::now(),
        .meeting_ids = {},
    };
    folders_.push_back(folder);
    save_index();
    notify();
    return folder;
}

bool MeetingStore::rename_folder(const std::string& id, const std::string& name) {
    auto trimmed = trim(name);
    if (trimmed.empty()) return false;

    auto* folder = find_folder(id);
    if (!folder) return false;

    folder->name = std::move(trimmed);
    save_index();
    notify();
    return true;
}

bool MeetingStore::delete_folder(const std::string& id) {
    auto* folder = find_folder(id);
    if (!folder) return false;

    // Members become unfiled; the meetings themselves are kept.
    auto members = folder->meeting_ids;
    for (const auto& meeting_id : members) {
        move_meeting(meeting_id, std::nullopt);
    }

    std::erase_if(folders_, [&](const MeetingFolder& f) { return f.id == id; });
    save_index();
    notify();
    return true;
}

bool MeetingStore::move_meeting(const std::string& meeting_id,
                                const std::optional<std::string>& folder_id) {
    if (folder_id && !find_folder(*folder_id)) {
        return false;
    }

    for (auto& f : folders_) {
        std::erase(f.meeting_ids, meeting_id);
    }

    auto m = meeting(meeting_id);
    if (!m) {
        // Unknown meeting: membership is cleaned up, nothing is added.
        save_index();
        notify();
        return false;
    }

    if (folder_id) {
        auto* target = find_folder(*folder_id);
        if (std::ranges::find(target->meeting_ids, meeting_id) == target->meeting_ids.end()) {
            target->meeting_ids.push_back(meeting_id);
        }
    }

    m->folder_id = folder_id;
    update_meeting(*m);
    return true;
}

std::optional<MeetingFolder> MeetingStore::folder(const std::string& id) const {
    auto it = std::ranges::find_if(folders_, [&](const MeetingFolder& f) { return f.id == id; });
    if (it == folders_.end()) return std::nullopt;
    return *it;
}

bool MeetingStore::has_summary(const std::string& id) const {
    return std::ranges::any_of(summaries_, [&](const MeetingSummary& s) { return s.id == id; });
}

MeetingFolder* MeetingStore::find_folder(const std::string& id) {
    auto it = std::ranges::find_if(folders_, [&](const MeetingFolder& f) { return f.id == id; });
    return it != folders_.end() ? &*it : nullptr;
}

// --- Queries ---

std::vector<MeetingSummary> MeetingStore::unfiled_summaries() const {
    std::vector<MeetingSummary> out;
    std::ranges::copy_if(summaries_, std::back_inserter(out),
                         [](const MeetingSummary& s) { return !s.folder_id.has_value(); });
    std::ranges::stable_sort(out, std::ranges::greater{}, &MeetingSummary::updated_at);
    return out;
}

std::vector<MeetingSummary> MeetingStore::summaries_for_folder(const std::string& folder_id) const {
    std::vector<MeetingSummary> out;
    auto f = folder(folder_id);
    if (!f) return out;

    for (const auto& id : f->meeting_ids) {
        auto it = std::ranges::find_if(summaries_, [&](const MeetingSummary& s) { return s.id == id; });
        if (it != summaries_.end()) out.push_back(*it);
    }
    return out;
}

void MeetingStore::clear_all() {
    summaries_.clear();
    folders_.clear();
    cache_.clear();
    writer_.remove_all(root_);
    notify();
}

// --- Events ---

void MeetingStore::subscribe(ChangeListener listener) {
    listeners_.push_back(std::move(listener));
}

void MeetingStore::notify() {
    for (auto& l : listeners_) l();
}

void MeetingStore::flush() {
    writer_.flush();
}

// --- Persistence ---

void MeetingStore::sort_summaries() {
    std::ranges::stable_sort(summaries_, std::ranges::greater{}, &MeetingSummary::updated_at);
}

void MeetingStore::save_meeting(const Meeting& meeting) {
    writer_.write(meeting_path(meeting.id), json(meeting).dump(2, ' ', false, json::error_handler_t::replace));
}

void MeetingStore::save_index() {
    json index = {{"summaries", summaries_}, {"folders", folders_}};
    writer_.write(index_path(), index.dump(2, ' ', false, json::error_handler_t::replace));
}

void MeetingStore::load_index() {
    summaries_.clear();
    folders_.clear();

    std::ifstream f(index_path());
    if (!f.is_open()) return;

    try {
        auto j = json::parse(f);
        auto summaries = j.at("summaries").get<std::vector<MeetingSummary>>();
        auto folders = j.at("folders").get<std::vector<MeetingFolder>>();
        summaries_ = std::move(summaries);
        folders_ = std::move(folders);
        sort_summaries();
    } catch (const std::exception& e) {
        // Lossy by policy: an unreadable index starts the store empty.
        std::println(stderr, "store: cannot decode {}: {}", index_path().string(), e.what());
        summaries_.clear();
        folders_.clear();
    }
}
