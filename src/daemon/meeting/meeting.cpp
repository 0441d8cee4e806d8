#include "meeting.hpp"

#include <cstdint>
#include <cstdio>
#include <ctime>
#include <format>
#include <random>
#include <stdexcept>

using json = nlohmann::json;

namespace {

json optional_timestamp(const std::optional<Timestamp>& ts) {
    if (!ts) return nullptr;
    return format_timestamp(*ts);
}

std::optional<Timestamp> read_optional_timestamp(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    auto ts = parse_timestamp(j[key].get<std::string>());
    if (!ts) throw std::invalid_argument(std::format("bad timestamp in '{}'", key));
    return ts;
}

Timestamp read_timestamp(const json& j, const char* key) {
    auto ts = parse_timestamp(j.at(key).get<std::string>());
    if (!ts) throw std::invalid_argument(std::format("bad timestamp in '{}'", key));
    return *ts;
}

MeetingStatus read_status(const json& j) {
    auto s = j.at("status").get<std::string>();
    auto status = meeting_status_from_string(s);
    if (!status) throw std::invalid_argument("unknown meeting status: " + s);
    return *status;
}

} // namespace

std::string_view to_string(MeetingStatus status) {
    switch (status) {
        case MeetingStatus::Recording: return "recording";
        case MeetingStatus::Processing: return "processing";
        case MeetingStatus::Completed: return "completed";
        case MeetingStatus::Failed: return "failed";
    }
    return "failed";
}

std::optional<MeetingStatus> meeting_status_from_string(std::string_view s) {
    if (s == "recording") return MeetingStatus::Recording;
    if (s == "processing") return MeetingStatus::Processing;
    if (s == "completed") return MeetingStatus::Completed;
    if (s == "failed") return MeetingStatus::Failed;
    return std::nullopt;
}

Utterance Utterance::make(int speaker_index, double start_time, double end_time,
                          std::string text) {
    return Utterance{
        .id = make_uuid(),
        .speaker_index = speaker_index,
        .start_time = start_time,
        .end_time = end_time,
        .text = std::move(text),
        .created_at = std::chrono::system_clock::now(),
    };
}

double Meeting::duration_s(Timestamp now) const {
    return std::chrono::duration<double>(ended_at.value_or(now) - started_at).count();
}

MeetingSummary MeetingSummary::from(const Meeting& meeting) {
    return MeetingSummary{
        .id = meeting.id,
        .title = meeting.title,
        .started_at = meeting.started_at,
        .ended_at = meeting.ended_at,
        .status = meeting.status,
        .utterance_count = meeting.utterances.size(),
        .folder_id = meeting.folder_id,
        .updated_at = meeting.ended_at.value_or(meeting.started_at),
    };
}

std::string make_uuid() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi = rng();
    uint64_t lo = rng();
    hi = (hi & ~uint64_t(0xF000)) | uint64_t(0x4000);                    // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;           // variant 10
    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       hi >> 32, (hi >> 16) & 0xFFFF, hi & 0xFFFF,
                       lo >> 48, lo & 0xFFFFFFFFFFFFULL);
}

std::string format_timestamp(Timestamp ts) {
    auto ms = std::chrono::floor<std::chrono::milliseconds>(ts);
    return std::format("{:%FT%T}Z", ms);
}

std::optional<Timestamp> parse_timestamp(std::string_view s) {
    using namespace std::chrono;

    std::string str(s);
    int y = 0, mo = 0, d = 0, h = 0, mi = 0;
    double sec = 0.0;
    int consumed = 0;
    if (std::sscanf(str.c_str(), "%4d-%2d-%2dT%2d:%2d:%lf%n",
                    &y, &mo, &d, &h, &mi, &sec, &consumed) != 6) {
        return std::nullopt;
    }
    if (str.substr(static_cast<size_t>(consumed)) != "Z") return std::nullopt;
    if (h > 23 || mi > 59 || sec < 0.0 || sec >= 61.0) return std::nullopt;

    year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) return std::nullopt;

    auto tp = sys_days{ymd} + hours{h} + minutes{mi} +
              round<milliseconds>(duration<double>(sec));
    return time_point_cast<system_clock::duration>(tp);
}

std::string default_meeting_title(Timestamp ts) {
    std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm local{};
    localtime_r(&t, &local);
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), "%b %d, %Y %H:%M", &local);
    return "Meeting " + std::string(buf, n);
}

void to_json(json& j, const Utterance& u) {
    j = json{
        {"id", u.id},
        {"speaker_index", u.speaker_index},
        {"start_time", u.start_time},
        {"end_time", u.end_time},
        {"text", u.text},
        {"created_at", format_timestamp(u.created_at)},
    };
}

void from_json(const json& j, Utterance& u) {
    u.id = j.at("id").get<std::string>();
    u.speaker_index = j.at("speaker_index").get<int>();
    u.start_time = j.at("start_time").get<double>();
    u.end_time = j.at("end_time").get<double>();
    u.text = j.at("text").get<std::string>();
    u.created_at = read_timestamp(j, "created_at");
}

void to_json(json& j, const Meeting& m) {
    j = json{
        {"id", m.id},
        {"title", m.title},
        {"started_at", format_timestamp(m.started_at)},
        {"ended_at", optional_timestamp(m.ended_at)},
        {"status", std::string(to_string(m.status))},
        {"utterances", m.utterances},
        {"folder_id", m.folder_id ? json(*m.folder_id) : json(nullptr)},
    };
}

void from_json(const json& j, Meeting& m) {
    m.id = j.at("id").get<std::string>();
    m.title = j.at("title").get<std::string>();
    m.started_at = read_timestamp(j, "started_at");
    m.ended_at = read_optional_timestamp(j, "ended_at");
    m.status = read_status(j);
    m.utterances = j.value("utterances", json::array()).get<std::vector<Utterance>>();
    m.folder_id.reset();
    if (j.contains("folder_id") && !j["folder_id"].is_null()) {
        m.folder_id = j["folder_id"].get<std::string>();
    }
}

void to_json(json& j, const MeetingSummary& s) {
    j = json{
        {"id", s.id},
        {"title", s.title},
        {"started_at", format_timestamp(s.started_at)},
        {"ended_at", optional_timestamp(s.ended_at)},
        {"status", std::string(to_string(s.status))},
        {"utterance_count", s.utterance_count},
        {"folder_id", s.folder_id ? json(*s.folder_id) : json(nullptr)},
        {"updated_at", format_timestamp(s.updated_at)},
    };
}

void from_json(const json& j, MeetingSummary& s) {
    s.id = j.at("id").get<std::string>();
    s.title = j.at("title").get<std::string>();
    s.started_at = read_timestamp(j, "started_at");
    s.ended_at = read_optional_timestamp(j, "ended_at");
    s.status = read_status(j);
    s.utterance_count = j.value("utterance_count", size_t(0));
    s.folder_id.reset();
    if (j.contains("folder_id") && !j["folder_id"].is_null()) {
        s.folder_id = j["folder_id"].get<std::string>();
    }
    s.updated_at = read_timestamp(j, "updated_at");
}

void to_json(json& j, const MeetingFolder& f) {
    j = json{
        {"id", f.id},
        {"name", f.name},
        {"created_at", format_timestamp(f.created_at)},
        {"meeting_ids", f.meeting_ids},
    };
}

void from_json(const json& j, MeetingFolder& f) {
    f.id = j.at("id").get<std::string>();
    f.name = j.at("name").get<std::string>();
    f.created_at = read_timestamp(j, "created_at");
    f.meeting_ids = j.value("meeting_ids", std::vector<std::string>{});
}
