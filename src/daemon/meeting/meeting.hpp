#pragma once

#include "../strings.hpp"

#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using Timestamp = std::chrono::system_clock::time_point;

enum class MeetingStatus { Recording, Processing, Completed, Failed };

std::string_view to_string(MeetingStatus status);
std::optional<MeetingStatus> meeting_status_from_string(std::string_view s);

struct Utterance {
    std::string id;
    int speaker_index = 0;
    double start_time = 0.0; // seconds from session start
    double end_time = 0.0;
    std::string text;
    Timestamp created_at;

    static Utterance make(int speaker_index, double start_time, double end_time,
                          std::string text);
};

struct Meeting {
    std::string id;
    std::string title;
    Timestamp started_at;
    std::optional<Timestamp> ended_at;
    MeetingStatus status = MeetingStatus::Recording;
    std::vector<Utterance> utterances;
    std::optional<std::string> folder_id;

    double duration_s(Timestamp now = std::chrono::system_clock::now()) const;
};

// Listing projection of a Meeting. Only MeetingStore builds these.
struct MeetingSummary {
    std::string id;
    std::string title;
    Timestamp started_at;
    std::optional<Timestamp> ended_at;
    MeetingStatus status = MeetingStatus::Recording;
    size_t utterance_count = 0;
    std::optional<std::string> folder_id;
    Timestamp updated_at;

    static MeetingSummary from(const Meeting& meeting);
};

struct MeetingFolder {
    std::string id;
    std::string name;
    Timestamp created_at;
    std::vector<std::string> meeting_ids;
};

// Random RFC 4122 version 4 id.
std::string make_uuid();

// ISO-8601 UTC with millisecond precision, e.g. 2026-10-17T11:24:05.123Z.
std::string format_timestamp(Timestamp ts);
std::optional<Timestamp> parse_timestamp(std::string_view s);

// "Meeting Oct 17, 2026 11:24" in local time.
std::string default_meeting_title(Timestamp ts);

void to_json(nlohmann::json& j, const Utterance& u);
void from_json(const nlohmann::json& j, Utterance& u);
void to_json(nlohmann::json& j, const Meeting& m);
void from_json(const nlohmann::json& j, Meeting& m);
void to_json(nlohmann::json& j, const MeetingSummary& s);
void from_json(const nlohmann::json& j, MeetingSummary& s);
void to_json(nlohmann::json& j, const MeetingFolder& f);
void from_json(const nlohmann::json& j, MeetingFolder& f);
